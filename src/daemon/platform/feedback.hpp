#pragma once

#include <string>

enum class Cue { Start, Processing, Done, Error, Reset };

// Sound cues and desktop notifications. Implementations must not block the caller.
class Feedback {
public:
    virtual ~Feedback() = default;
    virtual void cue(Cue cue) = 0;
    virtual void notify(const std::string& message) = 0;
};
