#pragma once

#include "platform/feedback.hpp"

#include <string>

// Plays freedesktop sounds with pw-play and posts notify-send notifications.
// Children are never waited for on the caller's thread.
class DesktopFeedback : public Feedback {
public:
    struct Options {
        bool sounds = true;
        bool notifications = true;
        std::string sound_dir = "/usr/share/sounds/freedesktop/stereo";
    };

    explicit DesktopFeedback(Options options);

    void cue(Cue cue) override;
    void notify(const std::string& message) override;

    static const char* sound_name(Cue cue);

private:
    Options options_;
};
