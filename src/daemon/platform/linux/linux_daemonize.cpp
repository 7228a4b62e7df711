#include "platform/daemonizer.hpp"

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <fcntl.h>
#include <print>
#include <sys/stat.h>
#include <unistd.h>

namespace platform {

namespace {

bool redirect_to_null(int target, int flags) {
    int fd = ::open("/dev/null", flags | O_CLOEXEC);
    if (fd < 0) return false;
    bool ok = ::dup2(fd, target) >= 0;
    ::close(fd);
    return ok;
}

} // namespace

bool daemonize() {
    pid_t pid = fork();
    if (pid < 0) {
        std::println(stderr, "daemon: fork() failed: {}", std::strerror(errno));
        return false;
    }
    if (pid > 0) _exit(0);

    if (setsid() < 0) {
        std::println(stderr, "daemon: setsid() failed: {}", std::strerror(errno));
        _exit(1);
    }

    // Second fork so we can never reacquire a controlling terminal
    pid = fork();
    if (pid < 0) _exit(1);
    if (pid > 0) _exit(0);

    umask(027);
    if (chdir("/") != 0) {
        std::println(stderr, "daemon: chdir(/) failed: {}", std::strerror(errno));
    }

    std::fflush(stdout);
    std::fflush(stderr);
    redirect_to_null(STDIN_FILENO, O_RDONLY);
    redirect_to_null(STDOUT_FILENO, O_WRONLY);
    redirect_to_null(STDERR_FILENO, O_WRONLY);
    return true;
}

} // namespace platform
