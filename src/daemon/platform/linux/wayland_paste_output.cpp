#include "platform/linux/wayland_paste_output.hpp"

#include "platform/linux/child_process.hpp"

#include <print>
#include <thread>

WaylandPasteOutput::WaylandPasteOutput(Options options)
    : options_(std::move(options)) {}

std::vector<std::string> WaylandPasteOutput::chord_command(const std::string& keys) {
    std::vector<std::string> parts;
    size_t start = 0;
    while (start <= keys.size()) {
        auto plus = keys.find('+', start);
        if (plus == std::string::npos) plus = keys.size();
        if (plus > start) parts.push_back(keys.substr(start, plus - start));
        start = plus + 1;
    }

    std::vector<std::string> argv = {"wtype"};
    if (parts.empty()) return argv;
    for (size_t i = 0; i + 1 < parts.size(); ++i) {
        argv.insert(argv.end(), {"-M", parts[i]});
    }
    argv.insert(argv.end(), {"-k", parts.back()});
    return argv;
}

std::expected<void, std::string> WaylandPasteOutput::deliver(const std::string& text) {
    std::string saved;
    bool have_saved = false;
    if (options_.restore_clipboard) {
        auto old = clipboard_.read();
        if (old) {
            saved = std::move(*old);
            have_saved = true;
        } else {
            std::println(stderr, "paste: not restoring clipboard: {}", old.error());
        }
    }

    auto res = clipboard_.deliver(text);
    if (!res) return res;

    // Give wl-copy time to take clipboard ownership.
    std::this_thread::sleep_for(std::chrono::milliseconds(10));

    auto chord = child::run(chord_command(options_.keys));
    if (!chord) return std::unexpected(chord.error());
    if (chord->exit_code != 0) {
        return std::unexpected("wtype paste failed with code " + std::to_string(chord->exit_code));
    }

    if (have_saved) {
        // The target reads the clipboard asynchronously after the keystroke.
        std::this_thread::sleep_for(options_.restore_delay);
        auto restored = saved.empty() ? clipboard_.clear() : clipboard_.deliver(saved);
        if (!restored) {
            std::println(stderr, "paste: could not restore clipboard: {}", restored.error());
        }
    }

    return {};
}
