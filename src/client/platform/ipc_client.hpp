#pragma once

#include <nlohmann/json.hpp>
#include <string>

// Client end of the daemon's newline-delimited JSON channel.
class IpcClient {
public:
    virtual ~IpcClient() = default;
    virtual bool connect(const std::string& endpoint) = 0;
    virtual bool send(const nlohmann::json& cmd) = 0;
    // Waits for one response line; false on timeout, hangup or bad JSON.
    virtual bool recv(nlohmann::json& response, int timeout_ms = 10000) = 0;
    virtual void close() = 0;
};
