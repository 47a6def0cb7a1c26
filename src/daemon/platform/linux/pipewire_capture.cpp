#include "platform/linux/pipewire_capture.hpp"

#include <print>
#include <spa/param/audio/format-utils.h>
#include <spa/utils/result.h>

namespace {

// How long start() waits for the stream to leave the connecting state.
constexpr int connect_wait_seconds = 1;

} // namespace

PipeWireCapture::PipeWireCapture(size_t buffer_bytes, uint32_t sample_rate)
    : ring_buf_(buffer_bytes), sample_rate_(sample_rate) {}

PipeWireCapture::~PipeWireCapture() {
    capturing_.store(false, std::memory_order_release);
    teardown();
}

std::expected<void, std::string> PipeWireCapture::start(const std::string& device) {
    if (abandoned_.load(std::memory_order_acquire)) {
        return std::unexpected("capture was abandoned");
    }
    if (capturing_.load(std::memory_order_relaxed)) return {};

    loop_ = pw_thread_loop_new("pushscribe", nullptr);
    if (!loop_) {
        return std::unexpected("audio: failed to create thread loop");
    }

    auto* props = pw_properties_new(
        PW_KEY_MEDIA_TYPE, "Audio",
        PW_KEY_MEDIA_CATEGORY, "Capture",
        PW_KEY_MEDIA_ROLE, "Communication",
        PW_KEY_NODE_NAME, "pushscribe",
        PW_KEY_APP_NAME, "pushscribe",
        nullptr
    );
    if (!device.empty()) {
        pw_properties_set(props, PW_KEY_TARGET_OBJECT, device.c_str());
    }

    stream_ = pw_stream_new_simple(
        pw_thread_loop_get_loop(loop_),
        "pushscribe-capture",
        props,
        &stream_events_,
        this
    );

    if (!stream_) {
        teardown();
        return std::unexpected("audio: failed to create stream");
    }

    // S16_LE mono at the configured rate
    uint8_t buf[1024];
    spa_pod_builder b = SPA_POD_BUILDER_INIT(buf, sizeof(buf));
    auto info = SPA_AUDIO_INFO_RAW_INIT(
        .format = SPA_AUDIO_FORMAT_S16_LE,
        .rate = sample_rate_,
        .channels = 1
    );
    const spa_pod* params[1];
    params[0] = spa_format_audio_raw_build(&b, SPA_PARAM_EnumFormat, &info);

    int ret = pw_stream_connect(
        stream_,
        PW_DIRECTION_INPUT,
        PW_ID_ANY,
        static_cast<pw_stream_flags>(
            PW_STREAM_FLAG_AUTOCONNECT | PW_STREAM_FLAG_MAP_BUFFERS | PW_STREAM_FLAG_RT_PROCESS
        ),
        params, 1
    );

    if (ret < 0) {
        teardown();
        return std::unexpected(std::string("audio: stream connect failed: ") + spa_strerror(ret));
    }

    ring_buf_.clear();
    capturing_.store(true, std::memory_order_release);

    ret = pw_thread_loop_start(loop_);
    if (ret < 0) {
        capturing_.store(false, std::memory_order_release);
        teardown();
        return std::unexpected(std::string("audio: thread loop start failed: ") + spa_strerror(ret));
    }

    // A missing or busy device surfaces as an error state shortly after connect.
    pw_thread_loop_lock(loop_);
    auto state = pw_stream_get_state(stream_, nullptr);
    while (state == PW_STREAM_STATE_CONNECTING || state == PW_STREAM_STATE_UNCONNECTED) {
        if (pw_thread_loop_timed_wait(loop_, connect_wait_seconds) != 0) break;
        state = pw_stream_get_state(stream_, nullptr);
    }
    const char* error = nullptr;
    state = pw_stream_get_state(stream_, &error);
    std::string message = error ? error : "unknown error";
    pw_thread_loop_unlock(loop_);

    if (state == PW_STREAM_STATE_ERROR) {
        capturing_.store(false, std::memory_order_release);
        teardown();
        return std::unexpected("audio: device unavailable: " + message);
    }

    return {};
}

std::expected<std::vector<int16_t>, std::string> PipeWireCapture::stop() {
    if (abandoned_.load(std::memory_order_acquire)) {
        return std::unexpected("capture was abandoned");
    }
    if (!capturing_.exchange(false, std::memory_order_acq_rel)) {
        return std::unexpected("not capturing");
    }

    teardown();

    if (auto dropped = ring_buf_.dropped_bytes(); dropped > 0) {
        std::println(stderr, "audio: buffer full, dropped {:.1f}s of audio",
                     static_cast<double>(dropped) / (sample_rate_ * sizeof(int16_t)));
    }
    return ring_buf_.drain_samples();
}

void PipeWireCapture::abandon() {
    abandoned_.store(true, std::memory_order_release);
    capturing_.store(false, std::memory_order_release);
}

void PipeWireCapture::teardown() {
    if (loop_) {
        pw_thread_loop_stop(loop_);
    }
    if (stream_) {
        pw_stream_destroy(stream_);
        stream_ = nullptr;
    }
    if (loop_) {
        pw_thread_loop_destroy(loop_);
        loop_ = nullptr;
    }
}

void PipeWireCapture::on_process(void* userdata) {
    auto* self = static_cast<PipeWireCapture*>(userdata);

    auto* buf = pw_stream_dequeue_buffer(self->stream_);
    if (!buf) return;

    auto* d = &buf->buffer->datas[0];
    if (d->data && self->capturing_.load(std::memory_order_acquire) &&
        !self->abandoned_.load(std::memory_order_acquire)) {
        auto* data = static_cast<const uint8_t*>(d->data) + d->chunk->offset;
        self->ring_buf_.write(data, d->chunk->size);
    }

    pw_stream_queue_buffer(self->stream_, buf);
}

void PipeWireCapture::on_state_changed(void* userdata, enum pw_stream_state old,
                                       enum pw_stream_state state, const char* error) {
    auto* self = static_cast<PipeWireCapture*>(userdata);
    if (error && !self->abandoned_.load(std::memory_order_acquire)) {
        std::println(stderr, "audio: stream state {} -> {}: {}",
                     pw_stream_state_as_string(old),
                     pw_stream_state_as_string(state),
                     error);
    }
    pw_thread_loop_signal(self->loop_, false);
}
