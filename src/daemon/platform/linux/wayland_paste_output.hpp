#pragma once

#include "output/output.hpp"
#include "platform/linux/wayland_clipboard_output.hpp"

#include <chrono>
#include <string>
#include <vector>

// Pastes through the clipboard: save it, copy the text, send the paste chord
// with wtype, then put the previous contents back.
class WaylandPasteOutput : public OutputMethod {
public:
    struct Options {
        std::string keys = "ctrl+v";
        bool restore_clipboard = true;
        std::chrono::milliseconds restore_delay{500};
    };

    explicit WaylandPasteOutput(Options options);

    std::expected<void, std::string> deliver(const std::string& text) override;
    std::string name() const override { return "paste"; }

    // "ctrl+shift+v" -> wtype -M ctrl -M shift -k v
    static std::vector<std::string> chord_command(const std::string& keys);

private:
    Options options_;
    WaylandClipboardOutput clipboard_;
};
