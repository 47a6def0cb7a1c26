#include "config.hpp"

#include "platform/platform_paths.hpp"

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>
#include <print>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

template <typename T>
void read_key(const json& obj, const char* key, T& out) {
    if (obj.contains(key)) out = obj[key].get<T>();
}

Config with_expanded_paths(Config cfg) {
    cfg.local.cli_path = expand_home(cfg.local.cli_path);
    cfg.local.server_path = expand_home(cfg.local.server_path);
    cfg.local.model_path = expand_home(cfg.local.model_path);
    cfg.feedback.sound_dir = expand_home(cfg.feedback.sound_dir);
    return cfg;
}

// Auto-stop must fire before the safety reset, or a lost release is only ever
// recovered by discarding the recording.
void check_recording_timers(Config::Recording& rec) {
    const Config::Recording defaults;
    if (rec.auto_stop_seconds == 0) {
        std::println(stderr, "config: recording.auto_stop_seconds must be positive, using {}",
                     defaults.auto_stop_seconds);
        rec.auto_stop_seconds = defaults.auto_stop_seconds;
    }
    if (rec.safety_reset_seconds == 0) {
        std::println(stderr, "config: recording.safety_reset_seconds must be positive, using {}",
                     defaults.safety_reset_seconds);
        rec.safety_reset_seconds = defaults.safety_reset_seconds;
    }
    if (rec.auto_stop_seconds >= rec.safety_reset_seconds) {
        uint32_t raised = rec.auto_stop_seconds + 60;
        std::println(stderr,
                     "config: recording.safety_reset_seconds ({}) must exceed auto_stop_seconds ({}), using {}",
                     rec.safety_reset_seconds, rec.auto_stop_seconds, raised);
        rec.safety_reset_seconds = raised;
    }
}

} // namespace

std::string expand_home(const std::string& path) {
    if (path.empty() || path[0] != '~') return path;
    const char* home = std::getenv("HOME");
    if (!home) return path;
    return std::string(home) + path.substr(1);
}

std::string Config::resolved_api_key() const {
    if (!cloud.api_key.empty()) return cloud.api_key;
    const char* var = cloud.provider == "openai" ? "OPENAI_API_KEY" : "GROQ_API_KEY";
    const char* env = std::getenv(var);
    return env ? env : "";
}

Config Config::load(const std::string& path) {
    Config cfg;
    std::ifstream f(path);
    if (!f.is_open()) {
        std::println(stderr, "config: could not open {}, using defaults", path);
        return with_expanded_paths(cfg);
    }

    try {
        auto j = json::parse(f);

        if (j.contains("backend")) {
            auto& b = j["backend"];
            read_key(b, "mode", cfg.backend.mode);
            read_key(b, "language", cfg.backend.language);
        }

        if (j.contains("cloud")) {
            auto& c = j["cloud"];
            read_key(c, "provider", cfg.cloud.provider);
            if (cfg.cloud.provider == "openai") {
                cfg.cloud.url = "https://api.openai.com";
                cfg.cloud.model = "whisper-1";
            }
            read_key(c, "url", cfg.cloud.url);
            read_key(c, "model", cfg.cloud.model);
            read_key(c, "api_key", cfg.cloud.api_key);
            read_key(c, "timeout_seconds", cfg.cloud.timeout_seconds);
        }

        if (j.contains("local")) {
            auto& l = j["local"];
            read_key(l, "cli_path", cfg.local.cli_path);
            read_key(l, "server_path", cfg.local.server_path);
            read_key(l, "model_path", cfg.local.model_path);
            read_key(l, "use_server", cfg.local.use_server);
            read_key(l, "host", cfg.local.host);
            read_key(l, "port", cfg.local.port);
            read_key(l, "threads", cfg.local.threads);
            read_key(l, "startup_timeout_seconds", cfg.local.startup_timeout_seconds);
            read_key(l, "idle_timeout_minutes", cfg.local.idle_timeout_minutes);
        }

        if (j.contains("audio")) {
            auto& a = j["audio"];
            read_key(a, "sample_rate", cfg.audio.sample_rate);
            read_key(a, "max_seconds", cfg.audio.max_seconds);
            read_key(a, "device", cfg.audio.device);
        }

        if (j.contains("recording")) {
            auto& r = j["recording"];
            read_key(r, "auto_stop_seconds", cfg.recording.auto_stop_seconds);
            read_key(r, "safety_reset_seconds", cfg.recording.safety_reset_seconds);
            read_key(r, "min_seconds", cfg.recording.min_seconds);
        }

        if (j.contains("output")) {
            auto& o = j["output"];
            read_key(o, "method", cfg.output.method);
            read_key(o, "paste_keys", cfg.output.paste_keys);
            read_key(o, "restore_clipboard", cfg.output.restore_clipboard);
            read_key(o, "restore_delay_ms", cfg.output.restore_delay_ms);
        }

        if (j.contains("feedback")) {
            auto& fb = j["feedback"];
            read_key(fb, "sounds", cfg.feedback.sounds);
            read_key(fb, "notifications", cfg.feedback.notifications);
            read_key(fb, "sound_dir", cfg.feedback.sound_dir);
        }

    } catch (const json::exception& e) {
        std::println(stderr, "config: parse error: {}", e.what());
        return with_expanded_paths(Config{});
    }

    check_recording_timers(cfg.recording);
    return with_expanded_paths(std::move(cfg));
}

Config Config::load_default() {
    auto defaults = with_expanded_paths(Config{});

    auto dir = platform::config_dir();
    if (dir.empty()) return defaults;

    auto config_path = fs::path(dir) / "config.json";
    if (fs::exists(config_path)) {
        return load(config_path.string());
    }
    return defaults;
}
