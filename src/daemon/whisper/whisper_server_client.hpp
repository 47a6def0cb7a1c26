#pragma once

#include "http_backend.hpp"
#include "server/inference_client.hpp"

#include <string>

// Talks to a whisper.cpp whisper-server: GET /health, POST /inference.
class WhisperServerClient : public InferenceClient {
public:
    WhisperServerClient(std::string base_url, std::string language);

    bool healthy() override;
    std::expected<TranscriptResult, std::string>
        transcribe(std::span<const int16_t> audio, uint32_t sample_rate) override;

    const std::string& base_url() const { return base_url_; }

private:
    std::string base_url_;
    HttpBackend inference_;
};
