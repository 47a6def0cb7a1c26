#include "platform/linux/desktop_feedback.hpp"

#include "platform/linux/child_process.hpp"

#include <print>

DesktopFeedback::DesktopFeedback(Options options)
    : options_(std::move(options)) {}

const char* DesktopFeedback::sound_name(Cue cue) {
    switch (cue) {
        case Cue::Start: return "message-new-instant";
        case Cue::Processing: return "audio-volume-change";
        case Cue::Done: return "complete";
        case Cue::Error: return "dialog-error";
        case Cue::Reset: return "bell";
    }
    return "bell";
}

void DesktopFeedback::cue(Cue cue) {
    if (!options_.sounds) return;
    auto path = options_.sound_dir + "/" + sound_name(cue) + ".oga";
    if (auto res = child::spawn_detached({"pw-play", path}); !res) {
        std::println(stderr, "feedback: pw-play failed: {}", res.error());
    }
}

void DesktopFeedback::notify(const std::string& message) {
    if (!options_.notifications) return;
    auto res = child::spawn_detached({"notify-send", "--app-name=pushscribe",
                                      "--expire-time=3000", "pushscribe", message});
    if (!res) {
        std::println(stderr, "feedback: notify-send failed: {}", res.error());
    }
}
