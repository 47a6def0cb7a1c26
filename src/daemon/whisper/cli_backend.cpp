#include "cli_backend.hpp"

#include "platform/linux/child_process.hpp"
#include "wav_encoder.hpp"

#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <unistd.h>

namespace fs = std::filesystem;

namespace {

// Removes the temp WAV however transcribe() exits.
struct TempWav {
    std::string path;

    TempWav() {
        auto tmpl = (fs::temp_directory_path() / "pushscribe_XXXXXX.wav").string();
        std::vector<char> buf(tmpl.begin(), tmpl.end());
        buf.push_back('\0');
        int fd = ::mkstemps(buf.data(), 4);
        if (fd >= 0) {
            ::close(fd);
            path.assign(buf.data());
        }
    }

    ~TempWav() {
        if (!path.empty()) {
            std::error_code ec;
            fs::remove(path, ec);
        }
    }
};

} // namespace

CliBackend::CliBackend(std::string cli_path, std::string model_path,
                       std::string language, uint32_t threads)
    : cli_path_(std::move(cli_path)), model_path_(std::move(model_path)),
      language_(std::move(language)), threads_(threads) {}

std::vector<std::string> CliBackend::command_for(const std::string& wav_path) const {
    std::vector<std::string> argv = {cli_path_};
    if (!model_path_.empty()) {
        argv.insert(argv.end(), {"-m", model_path_});
    }
    argv.insert(argv.end(), {"-f", wav_path, "-nt", "-np", "-t", std::to_string(threads_)});
    if (!language_.empty()) {
        argv.insert(argv.end(), {"-l", language_});
    }
    return argv;
}

std::expected<TranscriptResult, std::string>
CliBackend::transcribe(std::span<const int16_t> audio, uint32_t sample_rate) {
    if (audio.empty()) {
        return std::unexpected("empty audio");
    }
    if (!fs::exists(cli_path_)) {
        return std::unexpected("whisper-cli not found at " + cli_path_);
    }

    TempWav tmp;
    if (tmp.path.empty()) {
        return std::unexpected("could not create temp file");
    }
    if (auto res = wav::write_file(tmp.path, audio, sample_rate); !res) {
        return std::unexpected(res.error());
    }

    auto start = std::chrono::steady_clock::now();
    auto run = child::run(command_for(tmp.path), std::nullopt, true);
    auto end = std::chrono::steady_clock::now();

    if (!run) {
        return std::unexpected(run.error());
    }
    if (run->exit_code != 0) {
        return std::unexpected("whisper-cli exited with code " + std::to_string(run->exit_code));
    }

    return TranscriptResult{
        .text = child::trim(run->out),
        .duration_s = wav::duration_seconds(audio.size(), sample_rate),
        .processing_s = std::chrono::duration<double>(end - start).count(),
        .backend = name(),
    };
}
