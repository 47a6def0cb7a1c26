#pragma once

#include "output/output.hpp"
#include "platform/audio_capture.hpp"
#include "platform/feedback.hpp"
#include "session.hpp"
#include "whisper/backend.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <expected>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <thread>
#include <vector>

enum class ResetReason { Hotkey, Signal, SafetyTimeout };

const char* to_string(ResetReason reason);

// Turns hotkey press/release events into capture sessions.
//
// mu_ guards decisions only. Capture start/stop, transcription and paste run
// without it; every result is checked against the session id under the lock
// before it is allowed to change state or reach the paste output.
class RecordingStateMachine {
public:
    using Clock = std::chrono::steady_clock;
    using Job = std::move_only_function<void()>;

    struct Options {
        std::string device;
        uint32_t sample_rate = 16000;
        std::chrono::milliseconds auto_stop{std::chrono::seconds(45)};
        std::chrono::milliseconds safety_reset{std::chrono::minutes(5)};
        std::chrono::milliseconds min_duration{300};
        // How long shutdown waits for capture stops before leaving them behind.
        std::chrono::milliseconds shutdown_grace{std::chrono::seconds(2)};
    };

    // Seams for time and threads. Empty members get the production behavior:
    // steady_clock, one worker thread per stop job, a detached thread per
    // abandoned capture.
    struct Hooks {
        std::function<Clock::time_point()> now;
        std::function<void(Job)> dispatch;
        std::function<void(std::unique_ptr<AudioCapture>)> dispose;
        std::function<void(const SessionReport&)> on_report;
        std::function<void(const std::string&)> log;
    };

    RecordingStateMachine(Options options, CaptureFactory make_capture,
                          WhisperBackend& backend, OutputMethod& output,
                          Feedback& feedback, Hooks hooks = {});
    ~RecordingStateMachine();

    RecordingStateMachine(const RecordingStateMachine&) = delete;
    RecordingStateMachine& operator=(const RecordingStateMachine&) = delete;

    // Starts a session when idle; stops the current one when recording.
    void press();
    void release();
    // For bindings that only see key-down.
    void toggle();
    void reset(ResetReason reason);
    // Timer event: auto-stop and the safety reset.
    void tick(Clock::time_point now);

    // Abandons a live recording and waits for in-flight transcriptions. Jobs
    // still blocked in capture stop() are left behind and never touch the
    // machine again.
    void shutdown();

    SessionState state() const;
    uint64_t session_id() const;
    double recording_duration() const;

private:
    void stop_recording(std::optional<uint64_t> expected_id, bool auto_stopped);
    void finish_stop_job(uint64_t id, std::expected<std::vector<int16_t>, std::string> audio);
    void complete(uint64_t id, std::expected<TranscriptResult, std::string> result);

    void dispatch(Job job);
    void dispose(std::unique_ptr<AudioCapture> capture);
    Clock::time_point now() const;
    void report(const SessionReport& r);
    void log(const std::string& msg) const;

    Options options_;
    CaptureFactory make_capture_;
    WhisperBackend& backend_;
    OutputMethod& output_;
    Feedback& feedback_;
    Hooks hooks_;

    mutable std::mutex mu_;
    CaptureSession session_;
    uint64_t next_id_ = 0;
    std::optional<uint64_t> starting_id_; // session whose press() is inside capture->start()
    bool stop_pending_ = false;           // a stop arrived for starting_id_
    bool resetting_ = false;
    bool shutting_down_ = false;
    std::unique_ptr<AudioCapture> standby_;

    // Shared with every stop job. Jobs hold mu shared from the moment their
    // capture has stopped until they are done with the machine; shutdown takes
    // it exclusively to close the gate.
    struct JobGate {
        std::shared_mutex mu;
        bool closed = false;
        std::atomic<int> in_capture_stop{0};
    };
    std::shared_ptr<JobGate> gate_ = std::make_shared<JobGate>();

    struct Worker {
        std::shared_ptr<std::atomic<bool>> done;
        std::jthread thread;
    };
    std::mutex workers_mu_;
    std::vector<Worker> workers_;
};
