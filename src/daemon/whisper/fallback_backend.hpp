#pragma once

#include "backend.hpp"

#include <functional>
#include <memory>
#include <string>
#include <vector>

// Tries each backend in order and returns the first success.
class FallbackBackend : public WhisperBackend {
public:
    // Called when a stage fails and a later stage will be tried.
    using FallbackCallback = std::function<void(const std::string& failed_backend,
                                                const std::string& error)>;

    explicit FallbackBackend(std::vector<std::unique_ptr<WhisperBackend>> chain,
                             FallbackCallback on_fallback = {});

    // A backend that produced an empty transcript heard no speech; later stages
    // would not do better, so that ends the chain as a failure.
    std::expected<TranscriptResult, std::string>
        transcribe(std::span<const int16_t> audio, uint32_t sample_rate) override;
    std::string name() const override;

    size_t size() const { return chain_.size(); }

private:
    std::vector<std::unique_ptr<WhisperBackend>> chain_;
    FallbackCallback on_fallback_;
};
