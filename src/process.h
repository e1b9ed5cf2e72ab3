#ifndef CONFINE_PROCESS_H
#define CONFINE_PROCESS_H

#include <sys/types.h>
#include <unistd.h>
#include <utility>
#include "shim.h"

// Runs |callback| in a forked child. The callback is expected not to return;
// if it does, the child exits with status 0.
template<typename Callback>
pid_t Fork(Callback callback) {
    pid_t pid = fork();
    CHECK_UNIX(pid);
    if (pid == 0) {
        callback();
        _exit(0);
    }
    return pid;
}

template<typename Callback>
pid_t Fork(EventLoop &loop, Callback callback) {
    loop.notify_fork(EventLoop::fork_prepare);
    pid_t pid = Fork([&loop, callback = std::move(callback)]() {
        loop.notify_fork(EventLoop::fork_child);
        callback();
    });
    loop.notify_fork(EventLoop::fork_parent);
    return pid;
}

#endif //CONFINE_PROCESS_H
