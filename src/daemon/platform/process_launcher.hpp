#pragma once

#include <expected>
#include <string>
#include <sys/types.h>
#include <vector>

// Spawns and observes child processes for the server supervisor.
class ProcessLauncher {
public:
    virtual ~ProcessLauncher() = default;

    virtual std::expected<pid_t, std::string> spawn(const std::vector<std::string>& argv) = 0;

    // False once the process has exited; reaps it if it is our child.
    virtual bool alive(pid_t pid) = 0;

    // Returns false if the process no longer exists.
    virtual bool signal(pid_t pid, int sig) = 0;
};
