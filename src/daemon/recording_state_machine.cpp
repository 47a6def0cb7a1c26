#include "recording_state_machine.hpp"

#include "wav_encoder.hpp"

#include <algorithm>
#include <format>
#include <print>

const char* to_string(ResetReason reason) {
    switch (reason) {
        case ResetReason::Hotkey: return "hotkey";
        case ResetReason::Signal: return "signal";
        case ResetReason::SafetyTimeout: return "safety timeout";
    }
    return "unknown";
}

RecordingStateMachine::RecordingStateMachine(Options options, CaptureFactory make_capture,
                                             WhisperBackend& backend, OutputMethod& output,
                                             Feedback& feedback, Hooks hooks)
    : options_(std::move(options)), make_capture_(std::move(make_capture)),
      backend_(backend), output_(output), feedback_(feedback),
      hooks_(std::move(hooks)) {}

RecordingStateMachine::~RecordingStateMachine() {
    shutdown();
}

void RecordingStateMachine::press() {
    std::unique_ptr<AudioCapture> capture;
    uint64_t id = 0;
    {
        std::unique_lock lock(mu_);
        if (shutting_down_) return;
        if (resetting_) {
            log("press ignored, reset in progress");
            return;
        }
        switch (session_.state) {
            case SessionState::Recording:
                lock.unlock();
                stop_recording(std::nullopt, false);
                return;
            case SessionState::Stopping:
            case SessionState::Transcribing:
                log(std::format("press ignored, session {} is {}", session_.id,
                                to_string(session_.state)));
                return;
            case SessionState::Idle:
                break;
        }

        id = ++next_id_;
        session_.id = id;
        session_.state = SessionState::Recording;
        session_.started_at = now();
        starting_id_ = id;
        stop_pending_ = false;
        capture = std::move(standby_);
    }

    if (!capture && make_capture_) capture = make_capture_();

    std::expected<void, std::string> started =
        capture ? capture->start(options_.device)
                : std::unexpected<std::string>("audio: no capture device available");

    std::unique_lock lock(mu_);
    if (starting_id_ == id) starting_id_.reset();

    if (session_.id != id || session_.state != SessionState::Recording) {
        // Reset while the stream was opening; this capture belongs to nobody.
        lock.unlock();
        log(std::format("session {} was reset during start", id));
        if (capture) {
            capture->abandon();
            dispose(std::move(capture));
        }
        return;
    }

    if (!started) {
        session_.state = SessionState::Idle;
        stop_pending_ = false;
        lock.unlock();
        std::println(stderr, "session: failed to start recording: {}", started.error());
        feedback_.cue(Cue::Error);
        feedback_.notify("Microphone unavailable: " + started.error());
        if (capture) dispose(std::move(capture));
        return;
    }

    session_.capture = std::move(capture);
    const bool stop_now = stop_pending_;
    stop_pending_ = false;
    lock.unlock();

    log(std::format("session {} recording", id));
    feedback_.cue(Cue::Start);

    if (stop_now) stop_recording(id, false);
}

void RecordingStateMachine::release() {
    stop_recording(std::nullopt, false);
}

void RecordingStateMachine::toggle() {
    press();
}

void RecordingStateMachine::stop_recording(std::optional<uint64_t> expected_id, bool auto_stopped) {
    std::unique_ptr<AudioCapture> capture;
    uint64_t id = 0;
    double seconds = 0.0;
    {
        std::lock_guard lock(mu_);
        if (expected_id && *expected_id != session_.id) return;
        if (session_.state != SessionState::Recording) {
            if (!auto_stopped) log("release ignored, not recording");
            return;
        }
        if (starting_id_ == session_.id) {
            stop_pending_ = true;
            return;
        }
        if (!session_.capture) {
            session_.state = SessionState::Idle;
            log(std::format("session {} has no capture, dropping it", session_.id));
            return;
        }
        session_.state = SessionState::Stopping;
        capture = std::move(session_.capture);
        id = session_.id;
        seconds = std::chrono::duration<double>(now() - session_.started_at).count();
    }

    log(std::format("session {} stopping after {:.1f}s{}", id, seconds,
                    auto_stopped ? " (auto-stop)" : ""));
    feedback_.cue(Cue::Processing);
    if (auto_stopped) {
        feedback_.notify(std::format("Auto-stopped after {:.0f}s", seconds));
    }

    dispatch([this, gate = gate_, id, capture = std::move(capture)]() mutable {
        ++gate->in_capture_stop;
        auto audio = capture->stop();
        capture.reset();

        std::shared_lock lock(gate->mu);
        --gate->in_capture_stop;
        if (gate->closed) return;
        finish_stop_job(id, std::move(audio));
    });
}

void RecordingStateMachine::finish_stop_job(uint64_t id,
                                            std::expected<std::vector<int16_t>, std::string> audio) {
    {
        std::lock_guard lock(mu_);
        if (session_.id != id || session_.state != SessionState::Stopping) {
            log(std::format("session {} was reset, dropping its audio", id));
            return;
        }
        session_.state = SessionState::Transcribing;
    }

    if (!audio) {
        complete(id, std::unexpected(audio.error()));
        return;
    }
    if (audio->empty()) {
        complete(id, std::unexpected<std::string>("no audio captured"));
        return;
    }

    const double duration = wav::duration_seconds(audio->size(), options_.sample_rate);
    if (duration < std::chrono::duration<double>(options_.min_duration).count()) {
        complete(id, std::unexpected(std::format("recording too short ({:.2f}s)", duration)));
        return;
    }

    log(std::format("session {} transcribing {:.1f}s via {}", id, duration, backend_.name()));
    complete(id, backend_.transcribe(*audio, options_.sample_rate));
}

void RecordingStateMachine::complete(uint64_t id,
                                     std::expected<TranscriptResult, std::string> result) {
    SessionReport r{.session_id = id};
    if (result) {
        r.result = *result;
    } else {
        r.error = result.error();
    }

    {
        std::lock_guard lock(mu_);
        if (session_.id != id || session_.state != SessionState::Transcribing) {
            r.outcome = SessionOutcome::Discarded;
            if (r.error.empty()) r.error = "session was reset";
        }
    }

    if (r.outcome == SessionOutcome::Discarded) {
        log(std::format("session {} is stale, discarding result", id));
        report(r);
        return;
    }

    if (result) {
        auto delivered = output_.deliver(result->text);
        if (delivered) {
            r.outcome = SessionOutcome::Pasted;
            log(std::format("session {} pasted {} chars from {} ({:.1f}s)", id,
                            result->text.size(), result->backend, result->processing_s));
            feedback_.cue(Cue::Done);
        } else {
            r.error = "paste failed: " + delivered.error();
            std::println(stderr, "session: {}", r.error);
            feedback_.cue(Cue::Error);
            feedback_.notify("Paste failed: " + delivered.error());
        }
    } else {
        std::println(stderr, "session: transcription failed: {}", r.error);
        feedback_.cue(Cue::Error);
        feedback_.notify("Transcription failed: " + r.error);
    }

    {
        std::lock_guard lock(mu_);
        if (session_.id == id && session_.state == SessionState::Transcribing) {
            session_.state = SessionState::Idle;
        }
    }
    report(r);
}

void RecordingStateMachine::reset(ResetReason reason) {
    std::unique_ptr<AudioCapture> abandoned;
    uint64_t id = 0;
    {
        std::lock_guard lock(mu_);
        if (session_.state == SessionState::Idle || resetting_ || shutting_down_) return;
        resetting_ = true;
        id = session_.id;
        abandoned = std::move(session_.capture);
        session_.state = SessionState::Idle;
        starting_id_.reset();
        stop_pending_ = false;
    }

    log(std::format("session {} reset ({})", id, to_string(reason)));

    if (abandoned) {
        abandoned->abandon();
        dispose(std::move(abandoned));
    }

    std::unique_ptr<AudioCapture> fresh = make_capture_ ? make_capture_() : nullptr;
    {
        std::lock_guard lock(mu_);
        standby_ = std::move(fresh);
        resetting_ = false;
    }

    feedback_.cue(Cue::Reset);
    feedback_.notify(reason == ResetReason::SafetyTimeout
                         ? "Recording reset after timeout"
                         : "Recording reset");
}

void RecordingStateMachine::tick(Clock::time_point at) {
    bool safety = false;
    bool auto_stop = false;
    uint64_t id = 0;
    {
        std::lock_guard lock(mu_);
        if (session_.state == SessionState::Idle || resetting_) return;
        const auto elapsed = at - session_.started_at;
        id = session_.id;
        if (elapsed >= options_.safety_reset) {
            safety = true;
        } else if (session_.state == SessionState::Recording && starting_id_ != id &&
                   elapsed >= options_.auto_stop) {
            auto_stop = true;
        }
    }

    if (safety) {
        std::println(stderr, "session: {} stuck for {}s, resetting", id,
                     std::chrono::duration_cast<std::chrono::seconds>(options_.safety_reset).count());
        reset(ResetReason::SafetyTimeout);
    } else if (auto_stop) {
        stop_recording(id, true);
    }
}

void RecordingStateMachine::shutdown() {
    std::unique_ptr<AudioCapture> capture;
    {
        std::lock_guard lock(mu_);
        if (shutting_down_) return;
        shutting_down_ = true;
        if (session_.state == SessionState::Recording) {
            capture = std::move(session_.capture);
            session_.state = SessionState::Idle;
        }
        standby_.reset();
    }
    if (capture) {
        capture->abandon();
        dispose(std::move(capture));
    }

    std::vector<Worker> workers;
    {
        std::lock_guard lock(workers_mu_);
        workers.swap(workers_);
    }
    auto pending = [&workers] {
        return std::ranges::count_if(workers, [](const Worker& w) { return !w.done->load(); });
    };
    if (pending() > 0) {
        log(std::format("waiting for {} pending transcription(s)", pending()));
    }

    // Every job past its capture stop is waited for. Jobs still inside stop()
    // get shutdown_grace, then are left behind.
    const auto deadline = Clock::now() + options_.shutdown_grace;
    while (pending() > 0) {
        if (Clock::now() >= deadline && pending() <= gate_->in_capture_stop.load()) break;
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    {
        std::unique_lock lock(gate_->mu);
        gate_->closed = true;
    }

    int stuck = 0;
    for (auto& w : workers) {
        if (w.done->load()) {
            w.thread.join();
        } else {
            ++stuck;
            w.thread.detach();
        }
    }
    if (stuck > 0) {
        std::println(stderr, "session: leaving {} capture stop(s) that did not return", stuck);
    }
}

SessionState RecordingStateMachine::state() const {
    std::lock_guard lock(mu_);
    return session_.state;
}

uint64_t RecordingStateMachine::session_id() const {
    std::lock_guard lock(mu_);
    return session_.id;
}

double RecordingStateMachine::recording_duration() const {
    std::lock_guard lock(mu_);
    if (session_.state != SessionState::Recording) return 0.0;
    return std::chrono::duration<double>(now() - session_.started_at).count();
}

void RecordingStateMachine::dispatch(Job job) {
    if (hooks_.dispatch) {
        hooks_.dispatch(std::move(job));
        return;
    }

    std::lock_guard lock(workers_mu_);
    std::erase_if(workers_, [](const Worker& w) { return w.done->load(); });
    auto done = std::make_shared<std::atomic<bool>>(false);
    workers_.push_back(Worker{
        .done = done,
        .thread = std::jthread([job = std::move(job), done]() mutable {
            job();
            done->store(true);
        }),
    });
}

void RecordingStateMachine::dispose(std::unique_ptr<AudioCapture> capture) {
    if (hooks_.dispose) {
        hooks_.dispose(std::move(capture));
        return;
    }
    // Tearing down an abandoned stream may block on the audio server.
    std::thread([capture = std::move(capture)]() mutable { capture.reset(); }).detach();
}

RecordingStateMachine::Clock::time_point RecordingStateMachine::now() const {
    return hooks_.now ? hooks_.now() : Clock::now();
}

void RecordingStateMachine::report(const SessionReport& r) {
    if (hooks_.on_report) hooks_.on_report(r);
}

void RecordingStateMachine::log(const std::string& msg) const {
    if (hooks_.log) hooks_.log(msg);
}
