#pragma once

#include <cerrno>
#include <cstdint>
#include <cstring>
#include <expected>
#include <fstream>
#include <span>
#include <string>
#include <vector>

// 16-bit mono PCM WAV, the format every transcription backend accepts.
namespace wav {

inline constexpr size_t header_size = 44;

inline std::vector<uint8_t> encode(std::span<const int16_t> samples, uint32_t sample_rate) {
    constexpr uint16_t channels = 1;
    constexpr uint16_t bits_per_sample = 16;
    uint32_t byte_rate = sample_rate * channels * bits_per_sample / 8;
    uint16_t block_align = channels * bits_per_sample / 8;
    uint32_t data_size = static_cast<uint32_t>(samples.size() * sizeof(int16_t));

    std::vector<uint8_t> out(header_size + data_size);
    auto w = [&out, pos = size_t(0)](const void* data, size_t len) mutable {
        std::memcpy(out.data() + pos, data, len);
        pos += len;
    };
    auto w16 = [&w](uint16_t v) { w(&v, 2); };
    auto w32 = [&w](uint32_t v) { w(&v, 4); };

    w("RIFF", 4);
    w32(36 + data_size);
    w("WAVE", 4);
    w("fmt ", 4);
    w32(16);
    w16(1);                 // PCM
    w16(channels);
    w32(sample_rate);
    w32(byte_rate);
    w16(block_align);
    w16(bits_per_sample);
    w("data", 4);
    w32(data_size);
    if (data_size > 0) {
        std::memcpy(out.data() + header_size, samples.data(), data_size);
    }

    return out;
}

inline double duration_seconds(size_t sample_count, uint32_t sample_rate) {
    if (sample_rate == 0) return 0.0;
    return static_cast<double>(sample_count) / sample_rate;
}

inline std::expected<void, std::string> write_file(const std::string& path,
                                                   std::span<const int16_t> samples,
                                                   uint32_t sample_rate) {
    auto data = encode(samples, sample_rate);
    std::ofstream f(path, std::ios::binary | std::ios::trunc);
    if (!f.is_open()) {
        return std::unexpected("cannot open " + path + ": " + std::strerror(errno));
    }
    f.write(reinterpret_cast<const char*>(data.data()),
            static_cast<std::streamsize>(data.size()));
    if (!f) {
        return std::unexpected("short write to " + path);
    }
    return {};
}

} // namespace wav
