#pragma once

#include <expected>
#include <optional>
#include <string>
#include <sys/types.h>
#include <vector>

namespace child {

struct Result {
    int exit_code = -1;
    std::string out; // stdout, when captured
};

// Runs argv to completion. stdin_data, when set, is written to the child's stdin;
// stdout is captured when capture_stdout is true, otherwise discarded.
// stderr goes to ours.
std::expected<Result, std::string> run(const std::vector<std::string>& argv,
                                       const std::optional<std::string>& stdin_data = std::nullopt,
                                       bool capture_stdout = false);

// Starts argv with stdio on /dev/null and reaps it from a detached thread.
std::expected<pid_t, std::string> spawn_detached(const std::vector<std::string>& argv);

// Call in a forked child before exec: the daemon blocks signals for its signalfd
// and ignores SIGPIPE, and children must not inherit either.
void reset_signals_in_child();

// Trims leading and trailing whitespace.
std::string trim(const std::string& s);

} // namespace child
