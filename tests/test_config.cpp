#include <catch2/catch_test_macros.hpp>

#include "config.hpp"

#include <cstdlib>
#include <filesystem>
#include <string>
#include <unistd.h>
#include <vector>

namespace {

// RAII temp file that auto-deletes.
struct TmpFile {
    std::string path;

    explicit TmpFile(const std::string& content) {
        path = std::filesystem::temp_directory_path() / "ps_test_config_XXXXXX";
        // mkstemp needs a mutable char*
        std::vector<char> tmpl(path.begin(), path.end());
        tmpl.push_back('\0');
        int fd = mkstemp(tmpl.data());
        path.assign(tmpl.data());
        REQUIRE(::write(fd, content.data(), content.size()) ==
                static_cast<ssize_t>(content.size()));
        ::close(fd);
    }

    ~TmpFile() { std::filesystem::remove(path); }
};

// Sets an environment variable for the scope of a test.
struct ScopedEnv {
    std::string name;
    std::string old;
    bool had_old;

    ScopedEnv(const char* n, const char* value) : name(n) {
        const char* prev = std::getenv(n);
        had_old = prev != nullptr;
        if (had_old) old = prev;
        if (value) ::setenv(n, value, 1);
        else ::unsetenv(n);
    }

    ~ScopedEnv() {
        if (had_old) ::setenv(name.c_str(), old.c_str(), 1);
        else ::unsetenv(name.c_str());
    }
};

} // namespace

TEST_CASE("Config", "[config]") {
    ScopedEnv home("HOME", "/home/tester");

    SECTION("DefaultValues") {
        Config cfg;
        REQUIRE(cfg.backend.mode == "auto");
        REQUIRE(cfg.backend.language == "en");
        REQUIRE(cfg.cloud.provider == "groq");
        REQUIRE(cfg.cloud.url == "https://api.groq.com/openai");
        REQUIRE(cfg.cloud.model == "whisper-large-v3");
        REQUIRE(cfg.local.port == 8178);
        REQUIRE(cfg.local.idle_timeout_minutes == 30);
        REQUIRE(cfg.local.startup_timeout_seconds == 30);
        REQUIRE(cfg.audio.sample_rate == 16000);
        REQUIRE(cfg.audio.ring_buffer_bytes() == 120 * 16000 * sizeof(int16_t));
        REQUIRE(cfg.recording.auto_stop_seconds == 45);
        REQUIRE(cfg.output.method == "paste");
        REQUIRE(cfg.output.restore_delay_ms == 500);
    }

    SECTION("LoadFullConfig") {
        TmpFile f(R"({
            "backend": { "mode": "local", "language": "de" },
            "local": {
                "server_path": "/opt/whisper/whisper-server",
                "model_path": "~/models/ggml-small.bin",
                "use_server": false,
                "port": 9000,
                "idle_timeout_minutes": 5
            },
            "audio": { "sample_rate": 48000, "max_seconds": 60, "device": "alsa_input.usb" },
            "recording": { "auto_stop_seconds": 20, "min_seconds": 0.5 },
            "output": { "method": "clipboard", "paste_keys": "ctrl+shift+v" },
            "feedback": { "sounds": false }
        })");

        auto cfg = Config::load(f.path);
        REQUIRE(cfg.backend.mode == "local");
        REQUIRE(cfg.backend.language == "de");
        REQUIRE(cfg.local.server_path == "/opt/whisper/whisper-server");
        REQUIRE(cfg.local.model_path == "/home/tester/models/ggml-small.bin");
        REQUIRE_FALSE(cfg.local.use_server);
        REQUIRE(cfg.local.port == 9000);
        REQUIRE(cfg.local.idle_timeout_minutes == 5);
        REQUIRE(cfg.audio.sample_rate == 48000);
        REQUIRE(cfg.audio.max_seconds == 60);
        REQUIRE(cfg.audio.device == "alsa_input.usb");
        REQUIRE(cfg.recording.auto_stop_seconds == 20);
        REQUIRE(cfg.recording.min_seconds == 0.5);
        REQUIRE(cfg.output.method == "clipboard");
        REQUIRE(cfg.output.paste_keys == "ctrl+shift+v");
        REQUIRE_FALSE(cfg.feedback.sounds);
        REQUIRE(cfg.feedback.notifications);
    }

    SECTION("LoadPartialConfig") {
        TmpFile f(R"({ "backend": { "language": "fr" } })");

        auto cfg = Config::load(f.path);
        REQUIRE(cfg.backend.language == "fr");
        // Other fields retain defaults
        REQUIRE(cfg.backend.mode == "auto");
        REQUIRE(cfg.output.method == "paste");
        REQUIRE(cfg.audio.sample_rate == 16000);
        REQUIRE(cfg.local.cli_path == "/home/tester/whisper.cpp/build/bin/whisper-cli");
    }

    SECTION("OpenAIProviderDefaults") {
        TmpFile f(R"({ "cloud": { "provider": "openai" } })");

        auto cfg = Config::load(f.path);
        REQUIRE(cfg.cloud.url == "https://api.openai.com");
        REQUIRE(cfg.cloud.model == "whisper-1");
    }

    SECTION("ExplicitCloudUrlWins") {
        TmpFile f(R"({ "cloud": { "provider": "openai", "url": "http://proxy:8000" } })");

        auto cfg = Config::load(f.path);
        REQUIRE(cfg.cloud.url == "http://proxy:8000");
        REQUIRE(cfg.cloud.model == "whisper-1");
    }

    SECTION("ApiKeyFromEnvironment") {
        ScopedEnv groq("GROQ_API_KEY", "gsk_env");
        ScopedEnv openai("OPENAI_API_KEY", "sk_env");

        Config cfg;
        REQUIRE(cfg.resolved_api_key() == "gsk_env");

        cfg.cloud.provider = "openai";
        REQUIRE(cfg.resolved_api_key() == "sk_env");

        cfg.cloud.api_key = "from_file";
        REQUIRE(cfg.resolved_api_key() == "from_file");
    }

    SECTION("NoApiKey") {
        ScopedEnv groq("GROQ_API_KEY", nullptr);
        Config cfg;
        REQUIRE(cfg.resolved_api_key().empty());
    }

    SECTION("LoadInvalidJson") {
        TmpFile f("not json {{{");

        auto cfg = Config::load(f.path);
        // Falls back to defaults
        REQUIRE(cfg.backend.mode == "auto");
        REQUIRE(cfg.audio.sample_rate == 16000);
        REQUIRE(cfg.local.model_path == "/home/tester/whisper.cpp/models/ggml-base.en.bin");
    }

    SECTION("WrongValueTypeFallsBack") {
        TmpFile f(R"({ "local": { "port": "not a number" } })");

        auto cfg = Config::load(f.path);
        REQUIRE(cfg.local.port == 8178);
    }

    SECTION("AutoStopBeyondSafetyResetIsClamped") {
        TmpFile f(R"({ "recording": { "auto_stop_seconds": 600, "safety_reset_seconds": 300 } })");

        auto cfg = Config::load(f.path);
        REQUIRE(cfg.recording.auto_stop_seconds == 600);
        REQUIRE(cfg.recording.safety_reset_seconds == 660);
    }

    SECTION("EqualTimersAreClamped") {
        TmpFile f(R"({ "recording": { "auto_stop_seconds": 120, "safety_reset_seconds": 120 } })");

        auto cfg = Config::load(f.path);
        REQUIRE(cfg.recording.auto_stop_seconds < cfg.recording.safety_reset_seconds);
    }

    SECTION("ZeroTimersUseDefaults") {
        TmpFile f(R"({ "recording": { "auto_stop_seconds": 0, "safety_reset_seconds": 0 } })");

        auto cfg = Config::load(f.path);
        REQUIRE(cfg.recording.auto_stop_seconds == 45);
        REQUIRE(cfg.recording.safety_reset_seconds == 300);
    }

    SECTION("LoadMissingFile") {
        auto cfg = Config::load("/tmp/ps_test_nonexistent_config_file.json");
        REQUIRE(cfg.backend.mode == "auto");
        REQUIRE(cfg.audio.sample_rate == 16000);
    }

    SECTION("ExpandHome") {
        REQUIRE(expand_home("~/x/y") == "/home/tester/x/y");
        REQUIRE(expand_home("/abs/path") == "/abs/path");
        REQUIRE(expand_home("").empty());
    }
}
