#pragma once

#include "backend.hpp"
#include "server/server_supervisor.hpp"

// Local inference through the supervised whisper-server, starting it on demand.
class ServerBackend : public WhisperBackend {
public:
    explicit ServerBackend(ServerSupervisor& supervisor);

    std::expected<TranscriptResult, std::string>
        transcribe(std::span<const int16_t> audio, uint32_t sample_rate) override;
    std::string name() const override { return "local-server"; }

private:
    ServerSupervisor& supervisor_;
};
