#pragma once

#include "platform/process_launcher.hpp"
#include "server/inference_client.hpp"
#include "whisper/backend.hpp"

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <expected>
#include <functional>
#include <mutex>
#include <span>
#include <string>
#include <sys/types.h>
#include <thread>
#include <vector>

enum class ServerState { Stopped, Starting, Ready, Stopping };

const char* to_string(ServerState state);

struct ServerOptions {
    std::vector<std::string> argv; // full whisper-server command line
    std::chrono::milliseconds startup_timeout{std::chrono::seconds(30)};
    std::chrono::milliseconds idle_timeout{std::chrono::minutes(30)};
    std::chrono::milliseconds reap_interval{std::chrono::seconds(5)};
    std::chrono::milliseconds health_poll_interval{250};
    std::chrono::milliseconds stop_grace{std::chrono::seconds(5)};
    std::chrono::milliseconds kill_wait{std::chrono::seconds(2)};
};

// Owns zero or one persistent local inference server.
//
// All state lives behind mu_. The lock covers decisions and state updates only:
// spawning, health polling, inference and termination run without it, so a slow
// start or stop never stalls callers that only need to observe the state.
// Concurrent ensure_running() calls share a single start attempt.
class ServerSupervisor {
public:
    using Clock = std::chrono::steady_clock;
    using Logger = std::function<void(const std::string&)>;

    ServerSupervisor(ServerOptions options, ProcessLauncher& launcher,
                     InferenceClient& client, Logger log = {});
    ~ServerSupervisor();

    ServerSupervisor(const ServerSupervisor&) = delete;
    ServerSupervisor& operator=(const ServerSupervisor&) = delete;

    // Returns once the server is Ready, or with the error of the start attempt
    // this call started or joined.
    std::expected<void, std::string> ensure_running();
    std::expected<void, std::string> ensure_running(std::chrono::milliseconds timeout);

    std::expected<TranscriptResult, std::string>
        transcribe(std::span<const int16_t> audio, uint32_t sample_rate);

    // SIGTERM, then SIGKILL after the grace period. Idempotent.
    std::expected<void, std::string> stop();

    // One reaper tick: crash detection plus idle shutdown. Returns true if it
    // stopped or lost the server.
    bool reap_idle(Clock::time_point now);

    void start_reaper();
    void stop_reaper();

    ServerState state() const;
    pid_t pid() const;
    Clock::time_point last_used_at() const;
    const ServerOptions& options() const { return options_; }

private:
    // Caller holds lock. Marks the server gone after an unexpected exit.
    void mark_crashed_locked();

    // Waits until state_ is not `from`, or the deadline passes.
    bool wait_while_locked(std::unique_lock<std::mutex>& lock, ServerState from,
                           Clock::time_point deadline);

    std::expected<void, std::string> start_process(std::chrono::milliseconds timeout,
                                                   uint64_t attempt);

    // No lock held. Escalates SIGTERM -> SIGKILL; false if the process survived.
    bool terminate_process(pid_t pid);
    bool wait_for_exit(pid_t pid, std::chrono::milliseconds limit);

    void finish_stop_locked();

    void log(const std::string& msg) const;

    ServerOptions options_;
    ProcessLauncher& launcher_;
    InferenceClient& client_;
    Logger log_;

    mutable std::mutex mu_;
    std::condition_variable cv_;
    ServerState state_ = ServerState::Stopped;
    pid_t pid_ = -1;
    Clock::time_point started_at_{};
    Clock::time_point last_used_at_{};
    int in_flight_ = 0;

    // Identifies start attempts so waiters report the outcome of the attempt
    // they joined, not a later one.
    uint64_t attempt_ = 0;
    uint64_t failed_attempt_ = 0;
    std::string last_error_;

    std::mutex reaper_mu_;
    std::condition_variable_any reaper_cv_;
    std::jthread reaper_;
};
