#include <catch2/catch_test_macros.hpp>

#include "platform/linux/posix_process_launcher.hpp"

#include <chrono>
#include <csignal>
#include <filesystem>
#include <fstream>
#include <string>
#include <thread>
#include <unistd.h>

using namespace std::chrono_literals;

namespace {

bool wait_exit(PosixProcessLauncher& launcher, pid_t pid) {
    for (int i = 0; i < 300; ++i) {
        if (!launcher.alive(pid)) return true;
        std::this_thread::sleep_for(10ms);
    }
    return false;
}

} // namespace

TEST_CASE("PosixProcessLauncher", "[process]") {
    auto log_path = (std::filesystem::temp_directory_path() /
                     ("ps_test_launcher_" + std::to_string(getpid()) + ".log")).string();
    PosixProcessLauncher launcher(log_path);

    SECTION("SpawnAndTerminate") {
        auto pid = launcher.spawn({"/bin/sleep", "30"});
        REQUIRE(pid.has_value());
        REQUIRE(launcher.alive(*pid));

        REQUIRE(launcher.signal(*pid, SIGTERM));
        REQUIRE(wait_exit(launcher, *pid));
        REQUIRE_FALSE(launcher.signal(*pid, SIGTERM));
    }

    SECTION("ExitIsReaped") {
        auto pid = launcher.spawn({"/bin/true"});
        REQUIRE(pid.has_value());
        REQUIRE(wait_exit(launcher, *pid));
        REQUIRE_FALSE(launcher.alive(*pid));
    }

    SECTION("OutputGoesToLog") {
        auto pid = launcher.spawn({"/bin/sh", "-c", "echo server says hi"});
        REQUIRE(pid.has_value());
        REQUIRE(wait_exit(launcher, *pid));

        std::ifstream in(log_path);
        std::string line;
        std::getline(in, line);
        REQUIRE(line == "server says hi");
    }

    SECTION("MissingBinary") {
        auto pid = launcher.spawn({"/nonexistent/whisper-server", "-m", "model.bin"});
        REQUIRE_FALSE(pid.has_value());
        REQUIRE(pid.error().find("/nonexistent/whisper-server") != std::string::npos);
    }

    SECTION("EmptyCommand") {
        REQUIRE_FALSE(launcher.spawn({}).has_value());
    }

    std::filesystem::remove(log_path);
}
