#include "platform/linux/wayland_clipboard_output.hpp"

#include "platform/linux/child_process.hpp"

std::expected<void, std::string> WaylandClipboardOutput::deliver(const std::string& text) {
    auto res = child::run({"wl-copy"}, text);
    if (!res) return std::unexpected(res.error());
    if (res->exit_code != 0) {
        return std::unexpected("wl-copy exited with code " + std::to_string(res->exit_code));
    }
    return {};
}

std::expected<std::string, std::string> WaylandClipboardOutput::read() {
    auto res = child::run({"wl-paste", "--no-newline", "--type", "text/plain"}, std::nullopt, true);
    if (!res) return std::unexpected(res.error());
    if (res->exit_code == 0) return std::move(res->out);

    // wl-paste exits 1 both for an empty clipboard and for one without text.
    auto types = child::run({"wl-paste", "--list-types"}, std::nullopt, true);
    if (!types) return std::unexpected(types.error());
    return text_from(*res, *types);
}

std::expected<std::string, std::string>
WaylandClipboardOutput::text_from(const child::Result& paste, const child::Result& types) {
    if (paste.exit_code == 0) return paste.out;
    auto listed = child::trim(types.out);
    if (types.exit_code == 0 && !listed.empty()) {
        auto first = listed.substr(0, listed.find('\n'));
        return std::unexpected("clipboard holds no text (" + first + ")");
    }
    return std::string{};
}

std::expected<void, std::string> WaylandClipboardOutput::clear() {
    auto res = child::run({"wl-copy", "--clear"});
    if (!res) return std::unexpected(res.error());
    if (res->exit_code != 0) {
        return std::unexpected("wl-copy --clear exited with code " + std::to_string(res->exit_code));
    }
    return {};
}
