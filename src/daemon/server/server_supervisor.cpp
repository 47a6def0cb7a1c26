#include "server/server_supervisor.hpp"

#include <algorithm>
#include <csignal>
#include <format>

const char* to_string(ServerState state) {
    switch (state) {
        case ServerState::Stopped: return "stopped";
        case ServerState::Starting: return "starting";
        case ServerState::Ready: return "ready";
        case ServerState::Stopping: return "stopping";
    }
    return "unknown";
}

ServerSupervisor::ServerSupervisor(ServerOptions options, ProcessLauncher& launcher,
                                   InferenceClient& client, Logger log)
    : options_(std::move(options)), launcher_(launcher), client_(client),
      log_(std::move(log)) {}

ServerSupervisor::~ServerSupervisor() {
    stop_reaper();
    if (auto res = stop(); !res) {
        log("server: " + res.error());
    }
}

std::expected<void, std::string> ServerSupervisor::ensure_running() {
    return ensure_running(options_.startup_timeout);
}

std::expected<void, std::string>
ServerSupervisor::ensure_running(std::chrono::milliseconds timeout) {
    std::unique_lock lock(mu_);
    const auto deadline = Clock::now() + timeout;

    while (true) {
        switch (state_) {
            case ServerState::Ready:
                if (!launcher_.alive(pid_)) {
                    mark_crashed_locked();
                    continue;
                }
                last_used_at_ = Clock::now();
                return {};

            case ServerState::Starting: {
                const uint64_t joined = attempt_;
                if (!wait_while_locked(lock, ServerState::Starting, deadline)) {
                    return std::unexpected("timed out waiting for server start");
                }
                if (state_ == ServerState::Ready) {
                    last_used_at_ = Clock::now();
                    return {};
                }
                if (failed_attempt_ == joined) {
                    return std::unexpected(last_error_);
                }
                continue;
            }

            case ServerState::Stopping:
                if (!wait_while_locked(lock, ServerState::Stopping, deadline)) {
                    return std::unexpected("timed out waiting for server stop");
                }
                continue;

            case ServerState::Stopped: {
                state_ = ServerState::Starting;
                const uint64_t attempt = ++attempt_;
                lock.unlock();
                auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
                    deadline - Clock::now());
                return start_process(std::max(remaining, std::chrono::milliseconds(0)), attempt);
            }
        }
    }
}

std::expected<void, std::string>
ServerSupervisor::start_process(std::chrono::milliseconds timeout, uint64_t attempt) {
    auto fail = [this, attempt](std::string error) -> std::expected<void, std::string> {
        std::lock_guard lock(mu_);
        state_ = ServerState::Stopped;
        pid_ = -1;
        failed_attempt_ = attempt;
        last_error_ = error;
        cv_.notify_all();
        log("server: start failed: " + error);
        return std::unexpected(std::move(error));
    };

    auto spawned = launcher_.spawn(options_.argv);
    if (!spawned) {
        return fail("spawn failed: " + spawned.error());
    }
    const pid_t pid = *spawned;

    {
        std::lock_guard lock(mu_);
        pid_ = pid;
        started_at_ = Clock::now();
    }
    log(std::format("server: spawned pid {}, waiting for health", pid));

    const auto deadline = Clock::now() + timeout;
    while (true) {
        if (!launcher_.alive(pid)) {
            return fail("server exited during startup");
        }
        if (client_.healthy()) {
            std::lock_guard lock(mu_);
            state_ = ServerState::Ready;
            last_used_at_ = Clock::now();
            cv_.notify_all();
            log(std::format("server: ready after {:.1f}s",
                            std::chrono::duration<double>(last_used_at_ - started_at_).count()));
            return {};
        }
        if (Clock::now() >= deadline) {
            launcher_.signal(pid, SIGKILL);
            wait_for_exit(pid, options_.kill_wait);
            return fail(std::format("server not healthy after {}ms", timeout.count()));
        }
        std::this_thread::sleep_for(options_.health_poll_interval);
    }
}

std::expected<TranscriptResult, std::string>
ServerSupervisor::transcribe(std::span<const int16_t> audio, uint32_t sample_rate) {
    {
        std::lock_guard lock(mu_);
        if (state_ != ServerState::Ready) {
            return std::unexpected(std::string("local server is ") + to_string(state_));
        }
        if (!launcher_.alive(pid_)) {
            mark_crashed_locked();
            return std::unexpected("local server exited unexpectedly");
        }
        ++in_flight_;
        last_used_at_ = Clock::now();
    }

    auto result = client_.transcribe(audio, sample_rate);

    std::lock_guard lock(mu_);
    --in_flight_;
    last_used_at_ = Clock::now();
    if (!result && state_ == ServerState::Ready && !launcher_.alive(pid_)) {
        mark_crashed_locked();
    }
    cv_.notify_all();
    return result;
}

std::expected<void, std::string> ServerSupervisor::stop() {
    std::unique_lock lock(mu_);
    pid_t pid = -1;

    while (pid < 0) {
        switch (state_) {
            case ServerState::Stopped:
                return {};

            case ServerState::Starting:
            case ServerState::Stopping: {
                // Let the other party finish; bounded by its own timeouts.
                const auto deadline = Clock::now() + options_.startup_timeout +
                                      options_.stop_grace + options_.kill_wait;
                auto from = state_;
                if (!wait_while_locked(lock, from, deadline)) {
                    return std::unexpected(std::string("timed out waiting for server ") + to_string(from));
                }
                continue;
            }

            case ServerState::Ready:
                state_ = ServerState::Stopping;
                pid = pid_;
                break;
        }
    }
    lock.unlock();

    log(std::format("server: stopping pid {}", pid));
    const bool exited = terminate_process(pid);

    lock.lock();
    finish_stop_locked();
    if (!exited) {
        return std::unexpected(std::format("pid {} survived SIGKILL", pid));
    }
    return {};
}

bool ServerSupervisor::reap_idle(Clock::time_point now) {
    pid_t pid = -1;
    {
        std::lock_guard lock(mu_);
        if (state_ != ServerState::Ready) return false;
        if (!launcher_.alive(pid_)) {
            mark_crashed_locked();
            return true;
        }
        if (in_flight_ > 0 || now - last_used_at_ < options_.idle_timeout) {
            return false;
        }
        state_ = ServerState::Stopping;
        pid = pid_;
    }

    log(std::format("server: idle for {} min, stopping pid {}",
                    std::chrono::duration_cast<std::chrono::minutes>(options_.idle_timeout).count(),
                    pid));
    terminate_process(pid);

    std::lock_guard lock(mu_);
    finish_stop_locked();
    return true;
}

void ServerSupervisor::start_reaper() {
    if (reaper_.joinable()) return;

    reaper_ = std::jthread([this](std::stop_token st) {
        while (!st.stop_requested()) {
            {
                std::unique_lock lock(reaper_mu_);
                reaper_cv_.wait_for(lock, st, options_.reap_interval, [] { return false; });
            }
            if (st.stop_requested()) break;
            reap_idle(Clock::now());
        }
    });
}

void ServerSupervisor::stop_reaper() {
    if (!reaper_.joinable()) return;
    reaper_.request_stop();
    reaper_.join();
}

ServerState ServerSupervisor::state() const {
    std::lock_guard lock(mu_);
    return state_;
}

pid_t ServerSupervisor::pid() const {
    std::lock_guard lock(mu_);
    return pid_;
}

ServerSupervisor::Clock::time_point ServerSupervisor::last_used_at() const {
    std::lock_guard lock(mu_);
    return last_used_at_;
}

void ServerSupervisor::mark_crashed_locked() {
    log(std::format("server: pid {} exited unexpectedly", pid_));
    state_ = ServerState::Stopped;
    pid_ = -1;
    cv_.notify_all();
}

bool ServerSupervisor::wait_while_locked(std::unique_lock<std::mutex>& lock, ServerState from,
                                         Clock::time_point deadline) {
    return cv_.wait_until(lock, deadline, [this, from] { return state_ != from; });
}

bool ServerSupervisor::terminate_process(pid_t pid) {
    if (!launcher_.signal(pid, SIGTERM)) {
        return wait_for_exit(pid, std::chrono::milliseconds(0));
    }
    if (wait_for_exit(pid, options_.stop_grace)) return true;

    log(std::format("server: pid {} ignored SIGTERM, sending SIGKILL", pid));
    launcher_.signal(pid, SIGKILL);
    return wait_for_exit(pid, options_.kill_wait);
}

bool ServerSupervisor::wait_for_exit(pid_t pid, std::chrono::milliseconds limit) {
    const auto deadline = Clock::now() + limit;
    const auto step = std::min<std::chrono::milliseconds>(std::chrono::milliseconds(50), limit);
    while (launcher_.alive(pid)) {
        if (Clock::now() >= deadline) return false;
        std::this_thread::sleep_for(step);
    }
    return true;
}

void ServerSupervisor::finish_stop_locked() {
    state_ = ServerState::Stopped;
    pid_ = -1;
    cv_.notify_all();
}

void ServerSupervisor::log(const std::string& msg) const {
    if (log_) log_(msg);
}
