#include "platform/linux/unix_socket_client.hpp"
#include "platform/platform_paths.hpp"

#include <charconv>
#include <nlohmann/json.hpp>
#include <print>
#include <string>

using json = nlohmann::json;

static void usage(const char* prog) {
    std::println(stderr, "Usage: {} <command> [options]", prog);
    std::println(stderr, "Commands:");
    std::println(stderr, "  press                       Start recording (hotkey down)");
    std::println(stderr, "  release                     Stop recording and transcribe (hotkey up)");
    std::println(stderr, "  toggle                      Start or stop recording");
    std::println(stderr, "  reset                       Abandon the current recording");
    std::println(stderr, "  status                      Show daemon status");
    std::println(stderr, "  history [--limit N]         Show transcription history");
    std::println(stderr, "  server [status|start|stop]  Control the local whisper server");
}

static void print_history(const json& response) {
    if (!response.contains("entries")) return;
    for (auto& entry : response["entries"]) {
        auto outcome = entry.value("outcome", "");
        std::println("[{}] #{} {} ({}, {:.1f}s audio, {:.1f}s)",
                     entry.value("timestamp", ""), entry.value("session", uint64_t{0}),
                     outcome, entry.value("backend", "-"),
                     entry.value("audio_duration", 0.0), entry.value("processing_time", 0.0));
        if (auto text = entry.value("text", ""); !text.empty()) {
            std::println("  {}", text);
        }
        if (entry.contains("error")) {
            std::println("  Error: {}", entry["error"].get<std::string>());
        }
    }
}

int main(int argc, char* argv[]) {
    if (argc < 2) {
        usage(argv[0]);
        return 1;
    }

    std::string command = argv[1];
    std::string action = "status";
    int limit = 10;

    // Parse optional args
    for (int i = 2; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "--limit" && i + 1 < argc) {
            std::string value = argv[++i];
            auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), limit);
            if (ec != std::errc{} || ptr != value.data() + value.size() || limit <= 0) {
                std::println(stderr, "Invalid --limit: {}", value);
                return 1;
            }
        } else if (command == "server" && (arg == "status" || arg == "start" || arg == "stop")) {
            action = arg;
        } else {
            std::println(stderr, "Unexpected argument: {}", arg);
            usage(argv[0]);
            return 1;
        }
    }

    // Build command JSON
    json cmd;
    if (command == "press" || command == "release" || command == "toggle" ||
        command == "reset" || command == "status") {
        cmd = {{"cmd", command}};
    } else if (command == "history") {
        cmd = {{"cmd", "history"}, {"limit", limit}};
    } else if (command == "server") {
        cmd = {{"cmd", "server"}, {"action", action}};
    } else {
        std::println(stderr, "Unknown command: {}", command);
        usage(argv[0]);
        return 1;
    }

    // Connect and send
    UnixSocketClient client;
    auto sock_path = platform::ipc_endpoint();

    if (!client.connect(sock_path)) {
        std::println(stderr, "Failed to connect to daemon at {}", sock_path);
        std::println(stderr, "Is pushscribed running?");
        return 1;
    }

    if (!client.send(cmd)) {
        std::println(stderr, "Failed to send command");
        return 1;
    }

    json response;
    if (!client.recv(response)) {
        std::println(stderr, "No response from daemon (timeout)");
        return 1;
    }

    // Display response
    auto status = response.value("status", "");
    if (status == "error") {
        std::println(stderr, "Error: {}", response.value("message", "unknown error"));
        return 1;
    }
    if (status != "ok") {
        std::println("{}", response.dump(2));
        return 0;
    }

    if (command == "status") {
        std::println("State: {}", response.value("state", "unknown"));
        std::println("Session: {}", response.value("session", uint64_t{0}));
        if (response.contains("duration")) {
            std::println("Recording duration: {:.1f}s", response["duration"].get<double>());
        }
        std::println("Backends: {}", response.value("backend", ""));
        std::println("Local server: {}", response.value("server", "stopped"));
    } else if (command == "history") {
        print_history(response);
    } else if (command == "server") {
        std::println("Local server: {}", response.value("server", "unknown"));
        if (response.contains("server_pid")) {
            std::println("PID: {}", response["server_pid"].get<int>());
        }
    } else {
        std::println("{}", response.value("state", "OK"));
    }

    return 0;
}
