#include "platform/daemonizer.hpp"

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <print>
#include <unistd.h>

namespace platform {

void daemonize(const std::string& log_path) {
    pid_t pid = fork();
    if (pid < 0) {
        std::println(stderr, "fork() failed: {}", std::strerror(errno));
        _exit(1);
    }
    if (pid > 0) _exit(0);

    if (setsid() < 0) _exit(1);

    // Second fork so the daemon can never reacquire a controlling terminal.
    pid = fork();
    if (pid < 0) _exit(1);
    if (pid > 0) _exit(0);

    const char* out = log_path.empty() ? "/dev/null" : log_path.c_str();
    const char* mode = log_path.empty() ? "w" : "a";
    if (!freopen("/dev/null", "r", stdin) ||
        !freopen(out, mode, stdout) ||
        !freopen(out, mode, stderr)) {
        _exit(1);
    }
    setvbuf(stdout, nullptr, _IOLBF, 0);
    setvbuf(stderr, nullptr, _IOLBF, 0);
}

} // namespace platform
