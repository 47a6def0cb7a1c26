#include "platform/linux/posix_process_launcher.hpp"

#include "platform/linux/child_process.hpp"

#include <cerrno>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <sys/wait.h>
#include <unistd.h>

PosixProcessLauncher::PosixProcessLauncher(std::string log_path)
    : log_path_(std::move(log_path)) {}

std::expected<pid_t, std::string> PosixProcessLauncher::spawn(const std::vector<std::string>& argv) {
    if (argv.empty()) return std::unexpected("empty command");
    if (::access(argv[0].c_str(), X_OK) != 0) {
        return std::unexpected(argv[0] + ": " + std::strerror(errno));
    }

    std::vector<char*> args;
    for (auto& a : argv) args.push_back(const_cast<char*>(a.c_str()));
    args.push_back(nullptr);

    pid_t pid = ::fork();
    if (pid < 0) {
        return std::unexpected(std::string("fork() failed: ") + std::strerror(errno));
    }

    if (pid == 0) {
        child::reset_signals_in_child();
        // Own process group so a terminal ^C aimed at the daemon does not hit the server.
        ::setpgid(0, 0);
        int devnull = ::open("/dev/null", O_RDONLY);
        if (devnull >= 0) ::dup2(devnull, STDIN_FILENO);
        int log = ::open(log_path_.c_str(), O_WRONLY | O_CREAT | O_APPEND, 0600);
        if (log >= 0) {
            ::dup2(log, STDOUT_FILENO);
            ::dup2(log, STDERR_FILENO);
        }
        ::execv(args[0], args.data());
        ::_exit(127);
    }

    return pid;
}

bool PosixProcessLauncher::alive(pid_t pid) {
    if (pid <= 0) return false;

    int status = 0;
    pid_t waited = ::waitpid(pid, &status, WNOHANG);
    if (waited == pid) return false;      // exited, now reaped
    if (waited == 0) return true;         // our child, still running
    if (errno == ECHILD) {
        // Not our child (or already reaped): fall back to probing.
        return ::kill(pid, 0) == 0 || errno == EPERM;
    }
    return false;
}

bool PosixProcessLauncher::signal(pid_t pid, int sig) {
    if (pid <= 0) return false;
    return ::kill(pid, sig) == 0;
}
