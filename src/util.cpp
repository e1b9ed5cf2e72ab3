#include "util.h"

#include <fcntl.h>
#include <unistd.h>
#include <boost/algorithm/string/split.hpp>
#include <boost/algorithm/string/classification.hpp>

extern char **environ;

void WriteFile(const Path &file, StringView content) {
    OFStream sink(file, Ios::binary | Ios::trunc);
    CHECK(sink.is_open()) << "cannot open " << file;
    sink.write(content.data(), content.size());
    CHECK(sink.good()) << "cannot write " << file;
}

Vector<String> SplitList(const String &list) {
    Vector<String> items;
    boost::split(items, list, boost::is_any_of(","));
    Vector<String> result;
    for (String &item : items) {
        if (!item.empty()) {
            result.push_back(std::move(item));
        }
    }
    return result;
}

Pair<String, String> SplitAssignment(const String &assignment) {
    size_t pos = assignment.find('=');
    if (pos == String::npos) {
        return {assignment, String()};
    }
    return {assignment.substr(0, pos), assignment.substr(pos + 1)};
}

Environment CurrentEnvironment() {
    Environment env;
    for (char **entry = environ; entry && *entry; ++entry) {
        env.push_back(SplitAssignment(*entry));
    }
    return env;
}

Vector<String> BuildEnvironment(const Environment &inherited,
                                const Environment &overrides,
                                bool inherit) {
    Environment merged;
    HashMap<String, size_t> index;
    auto set = [&merged, &index](const Pair<String, String> &entry) {
        auto iter = index.find(entry.first);
        if (iter == index.end()) {
            index.emplace(entry.first, merged.size());
            merged.push_back(entry);
        } else {
            merged[iter->second].second = entry.second;
        }
    };
    if (inherit) {
        for (const auto &entry : inherited) {
            set(entry);
        }
    }
    for (const auto &entry : overrides) {
        set(entry);
    }
    Vector<String> envs;
    envs.reserve(merged.size());
    for (const auto &entry : merged) {
        envs.push_back(entry.first + "=" + entry.second);
    }
    return envs;
}

Vector<String> BuildArguments(const Path &executable, const Vector<String> &args) {
    Vector<String> argv;
    argv.reserve(args.size() + 1);
    argv.push_back(executable.filename().string());
    argv.insert(argv.end(), args.begin(), args.end());
    return argv;
}

int MoveAboveStdio(int fd) {
    if (fd > STDERR_FILENO) {
        return fd;
    }
    int moved = fcntl(fd, F_DUPFD_CLOEXEC, STDERR_FILENO + 1);
    CHECK_UNIX(moved);
    CHECK_UNIX(close(fd));
    return moved;
}

void Exec(const Path &path, const Vector<String> &args, const Vector<String> &envs) {
    Vector<const char *> arg_ptrs;
    arg_ptrs.reserve(args.size() + 1);
    for (const String &arg : args) {
        arg_ptrs.push_back(arg.c_str());
    }
    arg_ptrs.push_back(nullptr);
    Vector<const char *> env_ptrs;
    env_ptrs.reserve(envs.size() + 1);
    for (const String &env : envs) {
        env_ptrs.push_back(env.c_str());
    }
    env_ptrs.push_back(nullptr);
    execve(path.c_str(), const_cast<char **>(arg_ptrs.data()), const_cast<char **>(env_ptrs.data()));
}
