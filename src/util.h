#ifndef CONFINE_UTIL_H
#define CONFINE_UTIL_H

#include "shim.h"

using Environment = Vector<Pair<String, String>>;

void WriteFile(const Path &file, StringView content);

// Splits a comma-separated flag value, dropping empty items.
Vector<String> SplitList(const String &list);

// Splits "KEY=VALUE" at the first '='. A missing '=' yields an empty value.
Pair<String, String> SplitAssignment(const String &assignment);

Environment CurrentEnvironment();

// Starts from |inherited| when |inherit| is set, then applies |overrides| in
// order. Overrides replace inherited values in place; new keys are appended.
Vector<String> BuildEnvironment(const Environment &inherited,
                                const Environment &overrides,
                                bool inherit);

// argv for the target: the executable's base name followed by |args|.
Vector<String> BuildArguments(const Path &executable, const Vector<String> &args);

// Moves |fd| to the lowest free descriptor above stderr, close-on-exec, and
// closes the original. Returns the new descriptor.
int MoveAboveStdio(int fd);

// Replaces the process image. Returns only on failure, with errno set.
void Exec(const Path &path, const Vector<String> &args, const Vector<String> &envs);

#endif //CONFINE_UTIL_H
