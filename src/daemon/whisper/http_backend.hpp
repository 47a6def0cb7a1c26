#pragma once

#include "backend.hpp"

#include <string>

// Multipart WAV upload to an OpenAI-compatible endpoint (Groq, OpenAI) or to a
// whisper.cpp server's /inference endpoint.
class HttpBackend : public WhisperBackend {
public:
    struct Options {
        std::string name = "http";
        std::string url;
        std::string api_format = "openai"; // "openai" or "whisper.cpp"
        std::string model;                 // openai format only
        std::string api_key;               // sent as a Bearer token when set
        std::string language = "en";
        long timeout_seconds = 30;
    };

    explicit HttpBackend(Options options);
    ~HttpBackend() override;

    HttpBackend(const HttpBackend&) = delete;
    HttpBackend& operator=(const HttpBackend&) = delete;

    std::expected<TranscriptResult, std::string>
        transcribe(std::span<const int16_t> audio, uint32_t sample_rate) override;
    std::string name() const override { return options_.name; }

    // Extracts "text" from a transcription response body.
    static std::expected<std::string, std::string> parse_response(const std::string& body);

private:
    Options options_;
};
