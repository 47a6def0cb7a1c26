#pragma once

#include "platform/process_launcher.hpp"

#include <string>

// fork/exec launcher; child stdout and stderr are appended to log_path.
class PosixProcessLauncher : public ProcessLauncher {
public:
    explicit PosixProcessLauncher(std::string log_path);

    std::expected<pid_t, std::string> spawn(const std::vector<std::string>& argv) override;
    bool alive(pid_t pid) override;
    bool signal(pid_t pid, int sig) override;

private:
    std::string log_path_;
};
