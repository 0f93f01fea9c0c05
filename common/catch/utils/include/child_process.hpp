#pragma once

#ifndef __linux__
#error "Only linux is supported for death tests"
#endif

#include <defer.hpp>
#include <internal_assert.hpp>

#include <cerrno>
#include <csignal>
#include <cstdio>
#include <exception>
#include <string>
#include <sys/wait.h>
#include <unistd.h>

struct ChildResult {
    int status = 0;
    std::string err;

    bool Aborted() const {
        return WIFSIGNALED(status) && WTERMSIG(status) == SIGABRT;
    }

    bool Exited() const {
        return WIFEXITED(status);
    }

    int ExitCode() const {
        return WEXITSTATUS(status);
    }
};

// Runs `f` in a forked child and collects what it wrote to stderr.
// The child exits with 0 when `f` returns and with 3 when it throws.
template <class F>
ChildResult RunInChild(F&& f) {
    int fds[2];
    int r = pipe(fds);
    INTERNAL_ASSERT(r != -1);

    std::fflush(stdout);
    std::fflush(stderr);

    pid_t child = fork();
    INTERNAL_ASSERT(child != -1);

    if (child == 0) {
        close(fds[0]);
        if (dup2(fds[1], STDERR_FILENO) == -1) {
            _exit(4);
        }
        close(fds[1]);
        try {
            f();
        } catch (const std::exception& e) {
            std::fprintf(stderr, "exception: %s\n", e.what());
            _exit(3);
        }
        _exit(0);
    }

    close(fds[1]);
    DEFER {
        close(fds[0]);
    };

    ChildResult result;
    char buf[512];
    while (true) {
        auto rd = read(fds[0], buf, sizeof(buf));
        if (rd == -1 && errno == EINTR) {
            continue;
        }
        INTERNAL_ASSERT(rd != -1);
        if (rd == 0) {
            break;
        }
        result.err.append(buf, rd);
    }

    while (waitpid(child, &result.status, 0) == -1) {
        INTERNAL_ASSERT(errno == EINTR);
    }
    return result;
}
