#pragma once

#include <nlohmann/json.hpp>
#include <string>

// Newline-delimited JSON command channel.
class IpcServer {
public:
    enum class ReadResult {
        Message,  // cmd holds one complete command; more may be buffered
        Pending,  // partial line, wait for more data
        Closed,   // peer hung up or sent garbage
    };

    virtual ~IpcServer() = default;
    virtual bool start(const std::string& endpoint) = 0;
    virtual void stop() = 0;
    virtual int server_fd() const = 0;
    virtual int accept_client() = 0;

    // Reads from the socket only when no complete line is already buffered.
    virtual ReadResult read_command(int client_fd, nlohmann::json& cmd) = 0;

    virtual bool send_response(int client_fd, const nlohmann::json& response) = 0;
    virtual void close_client(int client_fd) = 0;
};
