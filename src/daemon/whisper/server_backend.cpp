#include "server_backend.hpp"

ServerBackend::ServerBackend(ServerSupervisor& supervisor)
    : supervisor_(supervisor) {}

std::expected<TranscriptResult, std::string>
ServerBackend::transcribe(std::span<const int16_t> audio, uint32_t sample_rate) {
    if (auto ready = supervisor_.ensure_running(); !ready) {
        return std::unexpected("local server unavailable: " + ready.error());
    }
    auto result = supervisor_.transcribe(audio, sample_rate);
    if (result) result->backend = name();
    return result;
}
