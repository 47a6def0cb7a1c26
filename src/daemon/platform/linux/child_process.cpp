#include "platform/linux/child_process.hpp"

#include <cerrno>
#include <cstring>
#include <csignal>
#include <fcntl.h>
#include <sys/wait.h>
#include <thread>
#include <unistd.h>

namespace child {

namespace {

std::string errno_message(const char* what) {
    return std::string(what) + " failed: " + std::strerror(errno);
}

std::vector<char*> make_argv(const std::vector<std::string>& argv) {
    std::vector<char*> out;
    out.reserve(argv.size() + 1);
    for (auto& a : argv) out.push_back(const_cast<char*>(a.c_str()));
    out.push_back(nullptr);
    return out;
}

void close_pipe(int fds[2]) {
    if (fds[0] >= 0) ::close(fds[0]);
    if (fds[1] >= 0) ::close(fds[1]);
}

std::expected<int, std::string> wait_exit(pid_t pid) {
    int status;
    while (::waitpid(pid, &status, 0) < 0) {
        if (errno == EINTR) continue;
        return std::unexpected(errno_message("waitpid()"));
    }
    if (WIFEXITED(status)) return WEXITSTATUS(status);
    if (WIFSIGNALED(status)) return 128 + WTERMSIG(status);
    return -1;
}

} // namespace

void reset_signals_in_child() {
    sigset_t empty;
    sigemptyset(&empty);
    ::sigprocmask(SIG_SETMASK, &empty, nullptr);
    ::signal(SIGPIPE, SIG_DFL);
}

std::expected<Result, std::string> run(const std::vector<std::string>& argv,
                                       const std::optional<std::string>& stdin_data,
                                       bool capture_stdout) {
    if (argv.empty()) return std::unexpected("empty command");

    int in_pipe[2] = {-1, -1};
    int out_pipe[2] = {-1, -1};
    if (stdin_data && ::pipe2(in_pipe, O_CLOEXEC) < 0) {
        return std::unexpected(errno_message("pipe()"));
    }
    if (capture_stdout && ::pipe2(out_pipe, O_CLOEXEC) < 0) {
        close_pipe(in_pipe);
        return std::unexpected(errno_message("pipe()"));
    }

    auto args = make_argv(argv);

    pid_t pid = ::fork();
    if (pid < 0) {
        close_pipe(in_pipe);
        close_pipe(out_pipe);
        return std::unexpected(errno_message("fork()"));
    }

    if (pid == 0) {
        reset_signals_in_child();
        if (stdin_data) {
            ::dup2(in_pipe[0], STDIN_FILENO);
        } else {
            int devnull = ::open("/dev/null", O_RDONLY);
            if (devnull >= 0) ::dup2(devnull, STDIN_FILENO);
        }
        if (capture_stdout) {
            ::dup2(out_pipe[1], STDOUT_FILENO);
        } else {
            int devnull = ::open("/dev/null", O_WRONLY);
            if (devnull >= 0) ::dup2(devnull, STDOUT_FILENO);
        }
        ::execvp(args[0], args.data());
        ::_exit(127);
    }

    Result result;

    if (stdin_data) {
        ::close(in_pipe[0]);
        const std::string& text = *stdin_data;
        size_t total_written = 0;
        while (total_written < text.size()) {
            ssize_t n = ::write(in_pipe[1], text.data() + total_written, text.size() - total_written);
            if (n < 0) {
                if (errno == EINTR) continue;
                break; // child exited early; its exit code tells the story
            }
            total_written += static_cast<size_t>(n);
        }
        ::close(in_pipe[1]);
    }

    if (capture_stdout) {
        ::close(out_pipe[1]);
        char buf[4096];
        while (true) {
            ssize_t n = ::read(out_pipe[0], buf, sizeof(buf));
            if (n < 0) {
                if (errno == EINTR) continue;
                break;
            }
            if (n == 0) break;
            result.out.append(buf, static_cast<size_t>(n));
        }
        ::close(out_pipe[0]);
    }

    auto code = wait_exit(pid);
    if (!code) return std::unexpected(code.error());
    if (*code == 127) {
        return std::unexpected(argv[0] + ": command not found");
    }
    result.exit_code = *code;
    return result;
}

std::expected<pid_t, std::string> spawn_detached(const std::vector<std::string>& argv) {
    if (argv.empty()) return std::unexpected("empty command");

    auto args = make_argv(argv);

    pid_t pid = ::fork();
    if (pid < 0) {
        return std::unexpected(errno_message("fork()"));
    }

    if (pid == 0) {
        reset_signals_in_child();
        int devnull = ::open("/dev/null", O_RDWR);
        if (devnull >= 0) {
            ::dup2(devnull, STDIN_FILENO);
            ::dup2(devnull, STDOUT_FILENO);
            ::dup2(devnull, STDERR_FILENO);
        }
        ::execvp(args[0], args.data());
        ::_exit(127);
    }

    std::thread([pid] {
        int status;
        while (::waitpid(pid, &status, 0) < 0 && errno == EINTR) {}
    }).detach();

    return pid;
}

std::string trim(const std::string& s) {
    auto start = s.find_first_not_of(" \t\n\r");
    if (start == std::string::npos) return {};
    auto end = s.find_last_not_of(" \t\n\r");
    return s.substr(start, end - start + 1);
}

} // namespace child
