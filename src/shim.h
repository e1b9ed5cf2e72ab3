#ifndef CONFINE_SHIM_H
#define CONFINE_SHIM_H

#include <stdlib.h>
#include <glog/logging.h>
#include <boost/asio.hpp>
#include <boost/filesystem.hpp>
#include <boost/filesystem/fstream.hpp>
#include <boost/optional.hpp>
#include <boost/utility/string_ref.hpp>
#include <memory>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

// Checks the result of a raw syscall wrapper returning -1 on failure. The
// errno description is appended by PLOG.
#define CHECK_UNIX(ret) PCHECK((ret) >= 0) << #ret " "

// Base.
template <typename Type>
using Box = std::unique_ptr<Type>;

template <typename Key, typename Value>
using HashMap = std::unordered_map<Key, Value>;

template <typename First, typename Second>
using Pair = std::pair<First, Second>;

template <typename Type>
using Optional = boost::optional<Type>;

using String = std::string;
using StringView = boost::string_ref;

template <typename Element>
using Vector = std::vector<Element>;

// File
using Path = boost::filesystem::path;
using Ios = std::ios;
using OFStream = boost::filesystem::ofstream;

inline bool Exists(const Path &path) {
    boost::system::error_code error_code;
    return boost::filesystem::exists(path, error_code);
}

inline bool IsDirectory(const Path &path) {
    boost::system::error_code error_code;
    return boost::filesystem::is_directory(path, error_code);
}

// I/O
using EventLoop = boost::asio::io_service;

#endif //CONFINE_SHIM_H
