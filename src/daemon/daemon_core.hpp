#pragma once

#include "config.hpp"
#include "output/output.hpp"
#include "platform/audio_capture.hpp"
#include "platform/feedback.hpp"
#include "platform/process_launcher.hpp"
#include "recording_state_machine.hpp"
#include "server/inference_client.hpp"
#include "server/server_supervisor.hpp"
#include "storage/history_db.hpp"
#include "whisper/fallback_backend.hpp"

#include <atomic>
#include <functional>
#include <memory>
#include <nlohmann/json.hpp>
#include <string>
#include <thread>

// Portable daemon logic: owns the recorder, the local server supervisor, the
// backend chain and history, and answers IPC commands. Platform pieces are
// injected by the event loop.
class DaemonCore {
public:
    DaemonCore(Config config, bool verbose,
               CaptureFactory make_capture, ProcessLauncher& launcher,
               InferenceClient& server_client, OutputMethod& output,
               Feedback& feedback);
    ~DaemonCore();

    DaemonCore(const DaemonCore&) = delete;
    DaemonCore& operator=(const DaemonCore&) = delete;

    // history_path empty: $XDG_DATA_HOME/pushscribe/history.db
    bool init(const std::string& history_path = {});

    nlohmann::json handle_command(const std::string& cmd_str, const nlohmann::json& cmd);

    void on_tick();
    void on_reset_signal();

    void shutdown();

    RecordingStateMachine& recorder() { return *recorder_; }
    ServerSupervisor& supervisor() { return supervisor_; }
    const WhisperBackend& backend() const { return *backend_; }

    static ServerOptions server_options(const Config& config);
    static std::string server_base_url(const Config& config);

    // Stages for backend.mode; the cloud stage needs an API key.
    static std::unique_ptr<FallbackBackend>
        build_backend(const Config& config, ServerSupervisor& supervisor,
                      FallbackBackend::FallbackCallback on_fallback);

private:
    nlohmann::json handle_recording(const std::string& cmd_str);
    nlohmann::json handle_status(const nlohmann::json& cmd);
    nlohmann::json handle_history(const nlohmann::json& cmd);
    nlohmann::json handle_server(const nlohmann::json& cmd);

    void record(const SessionReport& report);
    bool run_server_task(std::function<void()> task);

    void log(const std::string& msg);

    Config config_;
    bool verbose_;

    CaptureFactory make_capture_;
    OutputMethod& output_;
    Feedback& feedback_;

    HistoryDb history_db_;
    ServerSupervisor supervisor_;
    std::unique_ptr<FallbackBackend> backend_;
    std::unique_ptr<RecordingStateMachine> recorder_;

    // Server start/stop requested over IPC runs here, off the event loop.
    std::atomic<bool> server_task_busy_{false};
    std::jthread server_task_;
};
