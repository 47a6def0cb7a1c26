#include "session.hpp"

const char* to_string(SessionState state) {
    switch (state) {
        case SessionState::Idle: return "idle";
        case SessionState::Recording: return "recording";
        case SessionState::Stopping: return "stopping";
        case SessionState::Transcribing: return "transcribing";
    }
    return "unknown";
}

const char* to_string(SessionOutcome outcome) {
    switch (outcome) {
        case SessionOutcome::Pasted: return "pasted";
        case SessionOutcome::Discarded: return "discarded";
        case SessionOutcome::Failed: return "failed";
    }
    return "unknown";
}
