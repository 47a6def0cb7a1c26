#pragma once

#include "backend.hpp"

#include <string>
#include <vector>

// One-shot whisper.cpp CLI run per transcription. Slow (loads the model every
// time) but has no moving parts.
class CliBackend : public WhisperBackend {
public:
    CliBackend(std::string cli_path, std::string model_path,
               std::string language = "en", uint32_t threads = 4);

    std::expected<TranscriptResult, std::string>
        transcribe(std::span<const int16_t> audio, uint32_t sample_rate) override;
    std::string name() const override { return "local-cli"; }

    std::vector<std::string> command_for(const std::string& wav_path) const;

private:
    std::string cli_path_;
    std::string model_path_;
    std::string language_;
    uint32_t threads_;
};
