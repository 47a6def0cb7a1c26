#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>

struct Config {
    struct Backend {
        std::string mode = "auto"; // "auto", "cloud" or "local"
        std::string language = "en";
    } backend;

    struct Cloud {
        std::string provider = "groq"; // "groq" or "openai"
        std::string url = "https://api.groq.com/openai";
        std::string model = "whisper-large-v3";
        std::string api_key; // empty: taken from GROQ_API_KEY / OPENAI_API_KEY
        uint32_t timeout_seconds = 30;
    } cloud;

    struct Local {
        std::string cli_path = "~/whisper.cpp/build/bin/whisper-cli";
        std::string server_path = "~/whisper.cpp/build/bin/whisper-server";
        std::string model_path = "~/whisper.cpp/models/ggml-base.en.bin";
        bool use_server = true;
        std::string host = "127.0.0.1";
        uint16_t port = 8178;
        uint32_t threads = 4;
        uint32_t startup_timeout_seconds = 30;
        uint32_t idle_timeout_minutes = 30;
    } local;

    struct Audio {
        uint32_t sample_rate = 16000;
        uint32_t max_seconds = 120;
        std::string device; // PipeWire target object; empty = default source

        // Computed from max_seconds and sample_rate (no independent config key).
        size_t ring_buffer_bytes() const {
            return static_cast<size_t>(max_seconds) * sample_rate * sizeof(int16_t);
        }
    } audio;

    struct Recording {
        uint32_t auto_stop_seconds = 45;
        uint32_t safety_reset_seconds = 300;
        double min_seconds = 0.3;
    } recording;

    struct Output {
        std::string method = "paste"; // "paste" or "clipboard"
        std::string paste_keys = "ctrl+v";
        bool restore_clipboard = true;
        uint32_t restore_delay_ms = 500;
    } output;

    struct Feedback {
        bool sounds = true;
        bool notifications = true;
        std::string sound_dir = "/usr/share/sounds/freedesktop/stereo";
    } feedback;

    // Cloud API key after the environment fallback.
    std::string resolved_api_key() const;

    static Config load(const std::string& path);
    static Config load_default();
};

// Expands a leading "~" to $HOME.
std::string expand_home(const std::string& path);
