#include <catch2/catch_session.hpp>

#include <log.hpp>

static int RunTestsImpl(int argc, char* argv[]) {
    return Catch::Session().run(argc, argv);
}

#ifdef __linux__

#include <defer.hpp>
#include <internal_assert.hpp>

#include <cerrno>
#include <chrono>
#include <csignal>
#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <fcntl.h>
#include <sys/resource.h>
#include <sys/wait.h>
#include <type_traits>
#include <unistd.h>

struct CatchResult {
    uint64_t secret;
    int return_code;
};

static_assert(std::is_standard_layout_v<CatchResult> &&
              std::is_trivially_constructible_v<CatchResult>);

// The child reports its Catch result through a pipe, so a test that calls
// exit(0) cannot pass silently
static int RunTestsForked(int argc, char* argv[]) {
    const auto kSecret = static_cast<uint64_t>(
        std::chrono::high_resolution_clock::now().time_since_epoch().count());

    struct rlimit lim;
    int r = getrlimit(RLIMIT_NOFILE, &lim);
    INTERNAL_ASSERT(r != -1);
    INTERNAL_ASSERT(lim.rlim_cur > 8);

    int fds[2];
    r = pipe2(fds, O_CLOEXEC);
    INTERNAL_ASSERT(r != -1);

    int child = fork();
    INTERNAL_ASSERT(child != -1);

    if (child == 0) {
        close(fds[0]);
        int out = dup3(fds[1], static_cast<int>(lim.rlim_cur - 1), O_CLOEXEC);
        INTERNAL_ASSERT(out != -1);
        close(fds[1]);

        CatchResult result{
            .secret = kSecret,
            .return_code = RunTestsImpl(argc, argv),
        };

        char buf[sizeof(result)];
        memcpy(buf, &result, sizeof(buf));

        size_t pos = 0;
        while (pos < sizeof(buf)) {
            auto w = write(out, buf + pos, sizeof(buf) - pos);
            INTERNAL_ASSERT(w != -1);
            pos += w;
        }

        return result.return_code;
    }

    close(fds[1]);
    DEFER {
        close(fds[0]);
    };

    int status;
    while (waitpid(child, &status, 0) == -1) {
        INTERNAL_ASSERT(errno == EINTR);
    }

    if (WIFSIGNALED(status)) {
        Log(LogLevel::kError, "Test process killed by signal {} ({})",
            WTERMSIG(status), strsignal(WTERMSIG(status)));
        raise(WTERMSIG(status));
        return 1;
    }

    INTERNAL_ASSERT(WIFEXITED(status));
    auto exit_code = WEXITSTATUS(status);
    if (exit_code != 0) {
        return exit_code;
    }

    CatchResult result;
    char buf[sizeof(result)];
    size_t pos = 0;
    while (pos < sizeof(buf)) {
        auto rd = read(fds[0], buf + pos, sizeof(buf) - pos);
        INTERNAL_ASSERT(rd != -1);
        if (rd == 0) {
            break;
        }
        pos += rd;
    }

    if (pos < sizeof(buf)) {
        Log(LogLevel::kError,
            "No report from catch received. Probably you've performed "
            "exit(0) or something similar");
        return 1;
    }
    memcpy(&result, buf, sizeof(buf));

    INTERNAL_ASSERT(result.return_code == exit_code);
    INTERNAL_ASSERT(result.secret == kSecret);

    return 0;
}

static bool IsCI() {
    return std::getenv("CI") != nullptr;
}

static int RunTests(int argc, char* argv[]) {
    if (IsCI()) {
        Log(LogLevel::kInfo, "Running Catch tests in a forked process");
        return RunTestsForked(argc, argv);
    }
    return RunTestsImpl(argc, argv);
}

#else

static int RunTests(int argc, char* argv[]) {
    return RunTestsImpl(argc, argv);
}

#endif

int main(int argc, char* argv[]) {
    return RunTests(argc, argv);
}
