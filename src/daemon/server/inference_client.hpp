#pragma once

#include "whisper/backend.hpp"

#include <cstdint>
#include <expected>
#include <span>
#include <string>

// The supervised server's network surface.
class InferenceClient {
public:
    virtual ~InferenceClient() = default;

    // One health probe; must return within a couple of seconds.
    virtual bool healthy() = 0;

    virtual std::expected<TranscriptResult, std::string>
        transcribe(std::span<const int16_t> audio, uint32_t sample_rate) = 0;
};
