#pragma once

#include "platform/audio_capture.hpp"
#include "ring_buffer.hpp"

#include <atomic>
#include <cstdint>
#include <pipewire/pipewire.h>
#include <spa/param/audio/format-utils.h>

class PipeWireCapture : public AudioCapture {
public:
    PipeWireCapture(size_t buffer_bytes, uint32_t sample_rate = 16000);
    ~PipeWireCapture() override;

    PipeWireCapture(const PipeWireCapture&) = delete;
    PipeWireCapture& operator=(const PipeWireCapture&) = delete;

    std::expected<void, std::string> start(const std::string& device) override;
    std::expected<std::vector<int16_t>, std::string> stop() override;
    void abandon() override;
    bool is_capturing() const override { return capturing_.load(std::memory_order_relaxed); }

    // Process-wide pw_init/pw_deinit, held by the daemon for its lifetime.
    struct Library {
        Library() { pw_init(nullptr, nullptr); }
        ~Library() { pw_deinit(); }
        Library(const Library&) = delete;
        Library& operator=(const Library&) = delete;
    };

private:
    static void on_process(void* userdata);
    static void on_state_changed(void* userdata, enum pw_stream_state old,
                                 enum pw_stream_state state, const char* error);

    void teardown();

    RingBuffer ring_buf_;
    uint32_t sample_rate_;
    std::atomic<bool> capturing_{false};
    std::atomic<bool> abandoned_{false};

    pw_thread_loop* loop_ = nullptr;
    pw_stream* stream_ = nullptr;

    static constexpr pw_stream_events stream_events_ = {
        .version = PW_VERSION_STREAM_EVENTS,
        .state_changed = on_state_changed,
        .process = on_process,
    };
};
