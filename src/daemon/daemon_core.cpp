#include "daemon_core.hpp"

#include "platform/platform_paths.hpp"
#include "whisper/cli_backend.hpp"
#include "whisper/http_backend.hpp"
#include "whisper/server_backend.hpp"

#include <format>
#include <print>

DaemonCore::DaemonCore(Config config, bool verbose,
                       CaptureFactory make_capture, ProcessLauncher& launcher,
                       InferenceClient& server_client, OutputMethod& output,
                       Feedback& feedback)
    : config_(std::move(config)), verbose_(verbose),
      make_capture_(std::move(make_capture)),
      output_(output), feedback_(feedback),
      supervisor_(server_options(config_), launcher, server_client,
                  [this](const std::string& msg) { log(msg); }) {}

DaemonCore::~DaemonCore() {
    shutdown();
}

bool DaemonCore::init(const std::string& history_path) {
    std::string db_path = history_path;
    if (db_path.empty()) {
        auto data = platform::data_dir();
        db_path = !data.empty() ? data + "/history.db" : "/tmp/pushscribe/history.db";
    }
    if (!history_db_.open(db_path)) {
        std::println(stderr, "Warning: history DB failed to open, history disabled");
    }

    backend_ = build_backend(config_, supervisor_,
        [this](const std::string& failed, const std::string& error) {
            std::println(stderr, "[pushscribe] {} failed: {}", failed, error);
            if (failed != "local-server") {
                feedback_.notify("Using local fallback: " + error);
            }
        });
    if (backend_->size() == 0) {
        std::println(stderr, "No transcription backend available for mode '{}'",
                     config_.backend.mode);
        return false;
    }
    log("Backends: " + backend_->name());

    RecordingStateMachine::Options options{
        .device = config_.audio.device,
        .sample_rate = config_.audio.sample_rate,
        .auto_stop = std::chrono::seconds(config_.recording.auto_stop_seconds),
        .safety_reset = std::chrono::seconds(config_.recording.safety_reset_seconds),
        .min_duration = std::chrono::milliseconds(
            static_cast<int64_t>(config_.recording.min_seconds * 1000)),
    };
    recorder_ = std::make_unique<RecordingStateMachine>(
        options, make_capture_, *backend_, output_, feedback_,
        RecordingStateMachine::Hooks{
            .on_report = [this](const SessionReport& r) { record(r); },
            .log = [this](const std::string& msg) { log(msg); },
        });

    supervisor_.start_reaper();
    return true;
}

ServerOptions DaemonCore::server_options(const Config& config) {
    ServerOptions opts;
    opts.argv = {
        config.local.server_path,
        "-m", config.local.model_path,
        "--host", config.local.host,
        "--port", std::to_string(config.local.port),
        "-t", std::to_string(config.local.threads),
    };
    if (!config.backend.language.empty()) {
        opts.argv.insert(opts.argv.end(), {"-l", config.backend.language});
    }
    opts.startup_timeout = std::chrono::seconds(config.local.startup_timeout_seconds);
    opts.idle_timeout = std::chrono::minutes(config.local.idle_timeout_minutes);
    return opts;
}

std::string DaemonCore::server_base_url(const Config& config) {
    return std::format("http://{}:{}", config.local.host, config.local.port);
}

std::unique_ptr<FallbackBackend>
DaemonCore::build_backend(const Config& config, ServerSupervisor& supervisor,
                          FallbackBackend::FallbackCallback on_fallback) {
    std::vector<std::unique_ptr<WhisperBackend>> chain;
    const auto& mode = config.backend.mode;
    const bool want_cloud = mode == "auto" || mode == "cloud";
    const bool want_local = mode == "auto" || mode == "local";

    if (mode != "auto" && mode != "cloud" && mode != "local") {
        std::println(stderr, "Unknown backend mode: {}", mode);
        return std::make_unique<FallbackBackend>(std::move(chain));
    }

    if (want_cloud) {
        auto key = config.resolved_api_key();
        if (key.empty()) {
            std::println(stderr, "Warning: no {} API key, cloud transcription disabled",
                         config.cloud.provider);
        } else {
            chain.push_back(std::make_unique<HttpBackend>(HttpBackend::Options{
                .name = config.cloud.provider,
                .url = config.cloud.url,
                .api_format = "openai",
                .model = config.cloud.model,
                .api_key = std::move(key),
                .language = config.backend.language,
                .timeout_seconds = static_cast<long>(config.cloud.timeout_seconds),
            }));
        }
    }

    if (want_local) {
        if (config.local.use_server) {
            chain.push_back(std::make_unique<ServerBackend>(supervisor));
        }
        chain.push_back(std::make_unique<CliBackend>(
            config.local.cli_path, config.local.model_path,
            config.backend.language, config.local.threads));
    }

    return std::make_unique<FallbackBackend>(std::move(chain), std::move(on_fallback));
}

nlohmann::json DaemonCore::handle_command(const std::string& cmd_str,
                                          const nlohmann::json& cmd) {
    if (!recorder_) return {{"status", "error"}, {"message", "daemon not initialized"}};
    if (cmd_str == "press" || cmd_str == "release" || cmd_str == "toggle" ||
        cmd_str == "reset") {
        return handle_recording(cmd_str);
    }
    if (cmd_str == "status") return handle_status(cmd);
    if (cmd_str == "history") return handle_history(cmd);
    if (cmd_str == "server") return handle_server(cmd);
    return {{"status", "error"}, {"message", "unknown command"}};
}

nlohmann::json DaemonCore::handle_recording(const std::string& cmd_str) {
    if (cmd_str == "press") recorder_->press();
    else if (cmd_str == "release") recorder_->release();
    else if (cmd_str == "toggle") recorder_->toggle();
    else recorder_->reset(ResetReason::Hotkey);

    return {
        {"status", "ok"},
        {"state", to_string(recorder_->state())},
        {"session", recorder_->session_id()},
    };
}

nlohmann::json DaemonCore::handle_status(const nlohmann::json& /*cmd*/) {
    auto state = recorder_->state();
    nlohmann::json resp = {
        {"status", "ok"},
        {"state", to_string(state)},
        {"session", recorder_->session_id()},
        {"backend", backend_->name()},
        {"server", to_string(supervisor_.state())},
    };
    if (state == SessionState::Recording) {
        resp["duration"] = recorder_->recording_duration();
    }
    if (auto pid = supervisor_.pid(); pid > 0) {
        resp["server_pid"] = pid;
    }
    return resp;
}

nlohmann::json DaemonCore::handle_history(const nlohmann::json& cmd) {
    int limit = cmd.value("limit", 10);
    if (limit <= 0) {
        return {{"status", "error"}, {"message", "limit must be positive"}};
    }
    auto entries = history_db_.recent(limit);

    nlohmann::json resp = {{"status", "ok"}, {"entries", nlohmann::json::array()}};
    for (auto& e : entries) {
        nlohmann::json j = {
            {"id", e.id},
            {"timestamp", e.timestamp},
            {"session", e.session_id},
            {"text", e.text},
            {"audio_duration", e.audio_duration},
            {"processing_time", e.processing_time},
            {"backend", e.backend},
            {"outcome", e.outcome},
        };
        if (!e.error.empty()) j["error"] = e.error;
        resp["entries"].push_back(std::move(j));
    }
    return resp;
}

nlohmann::json DaemonCore::handle_server(const nlohmann::json& cmd) {
    auto action = cmd.value("action", "status");

    if (action == "status") {
        nlohmann::json resp = {
            {"status", "ok"},
            {"server", to_string(supervisor_.state())},
            {"url", server_base_url(config_)},
        };
        if (auto pid = supervisor_.pid(); pid > 0) resp["server_pid"] = pid;
        return resp;
    }

    if (action == "start") {
        bool queued = run_server_task([this] {
            if (auto res = supervisor_.ensure_running(); !res) {
                std::println(stderr, "[pushscribe] server start failed: {}", res.error());
            }
        });
        if (!queued) return {{"status", "error"}, {"message", "server task already running"}};
        return {{"status", "ok"}, {"server", "starting"}};
    }

    if (action == "stop") {
        bool queued = run_server_task([this] {
            if (auto res = supervisor_.stop(); !res) {
                std::println(stderr, "[pushscribe] server stop failed: {}", res.error());
            }
        });
        if (!queued) return {{"status", "error"}, {"message", "server task already running"}};
        return {{"status", "ok"}, {"server", "stopping"}};
    }

    return {{"status", "error"}, {"message", "unknown server action: " + action}};
}

bool DaemonCore::run_server_task(std::function<void()> task) {
    if (server_task_busy_.exchange(true)) return false;
    if (server_task_.joinable()) server_task_.join();
    server_task_ = std::jthread([this, task = std::move(task)] {
        task();
        server_task_busy_.store(false);
    });
    return true;
}

void DaemonCore::on_tick() {
    if (recorder_) recorder_->tick(RecordingStateMachine::Clock::now());
}

void DaemonCore::on_reset_signal() {
    if (recorder_) recorder_->reset(ResetReason::Signal);
}

void DaemonCore::record(const SessionReport& report) {
    history_db_.insert(HistoryEntry{
        .session_id = report.session_id,
        .text = report.result.text,
        .audio_duration = report.result.duration_s,
        .processing_time = report.result.processing_s,
        .backend = report.result.backend,
        .outcome = to_string(report.outcome),
        .error = report.error,
    });
}

void DaemonCore::shutdown() {
    if (recorder_) {
        log("Waiting for pending transcriptions to complete...");
        recorder_->shutdown();
    }
    if (server_task_.joinable()) server_task_.join();
    supervisor_.stop_reaper();
    if (auto res = supervisor_.stop(); !res) {
        std::println(stderr, "[pushscribe] server: {}", res.error());
    }
}

void DaemonCore::log(const std::string& msg) {
    if (verbose_) {
        std::println(stderr, "[pushscribe] {}", msg);
    }
}
