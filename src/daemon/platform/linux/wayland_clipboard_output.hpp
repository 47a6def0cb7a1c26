#pragma once

#include "output/output.hpp"
#include "platform/linux/child_process.hpp"

#include <expected>
#include <string>

// Copy-only output through wl-clipboard.
class WaylandClipboardOutput : public OutputMethod {
public:
    std::expected<void, std::string> deliver(const std::string& text) override;
    std::string name() const override { return "clipboard"; }

    // Current clipboard text; empty when nothing is copied. Fails when the
    // clipboard holds something other than text, which a restore cannot bring back.
    std::expected<std::string, std::string> read();
    std::expected<void, std::string> clear();

    // Interprets `wl-paste --type text/plain` and, when that failed,
    // `wl-paste --list-types`.
    static std::expected<std::string, std::string>
        text_from(const child::Result& paste, const child::Result& types);
};
