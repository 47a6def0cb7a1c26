#include "fallback_backend.hpp"

FallbackBackend::FallbackBackend(std::vector<std::unique_ptr<WhisperBackend>> chain,
                                 FallbackCallback on_fallback)
    : chain_(std::move(chain)), on_fallback_(std::move(on_fallback)) {}

std::expected<TranscriptResult, std::string>
FallbackBackend::transcribe(std::span<const int16_t> audio, uint32_t sample_rate) {
    if (chain_.empty()) {
        return std::unexpected("no transcription backend configured");
    }

    std::string errors;
    for (size_t i = 0; i < chain_.size(); ++i) {
        auto& backend = chain_[i];
        auto result = backend->transcribe(audio, sample_rate);
        if (result) {
            if (result->text.empty()) {
                return std::unexpected("no speech recognized");
            }
            if (result->backend.empty()) result->backend = backend->name();
            return result;
        }

        if (!errors.empty()) errors += "; ";
        errors += backend->name() + ": " + result.error();

        if (i + 1 < chain_.size() && on_fallback_) {
            on_fallback_(backend->name(), result.error());
        }
    }
    return std::unexpected(errors);
}

std::string FallbackBackend::name() const {
    std::string out;
    for (auto& backend : chain_) {
        if (!out.empty()) out += " -> ";
        out += backend->name();
    }
    return out;
}
