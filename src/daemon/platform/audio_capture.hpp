#pragma once

#include <cstdint>
#include <expected>
#include <functional>
#include <memory>
#include <string>
#include <vector>

// One input stream, owned by exactly one capture session.
class AudioCapture {
public:
    virtual ~AudioCapture() = default;

    // Opens the stream (16 kHz mono S16 unless configured otherwise) and starts
    // buffering. An empty device selects the default source.
    virtual std::expected<void, std::string> start(const std::string& device) = 0;

    // Graceful stop. May block; returns everything buffered so far.
    virtual std::expected<std::vector<int16_t>, std::string> stop() = 0;

    // Detach without waiting for the stream. The frame callback may still run
    // afterwards and must do nothing. Whoever holds the object destroys it later,
    // off the control thread.
    virtual void abandon() = 0;

    virtual bool is_capturing() const = 0;
};

using CaptureFactory = std::function<std::unique_ptr<AudioCapture>()>;
