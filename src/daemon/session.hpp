#pragma once

#include "platform/audio_capture.hpp"
#include "whisper/backend.hpp"

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>

enum class SessionState { Idle, Recording, Stopping, Transcribing };

const char* to_string(SessionState state);

// One press-to-release recording. The capture is owned here until it is either
// handed to the stop job or abandoned by a reset.
struct CaptureSession {
    uint64_t id = 0;
    SessionState state = SessionState::Idle;
    std::chrono::steady_clock::time_point started_at{};
    std::unique_ptr<AudioCapture> capture;
};

enum class SessionOutcome { Pasted, Discarded, Failed };

const char* to_string(SessionOutcome outcome);

// What became of a session that reached transcription.
struct SessionReport {
    uint64_t session_id = 0;
    SessionOutcome outcome = SessionOutcome::Failed;
    TranscriptResult result; // text is empty unless a backend produced one
    std::string error;
};
