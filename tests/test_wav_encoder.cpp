#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include "wav_encoder.hpp"

#include <cstdint>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>
#include <unistd.h>
#include <vector>

namespace {

uint16_t read_u16(const uint8_t* p) {
    uint16_t v;
    std::memcpy(&v, p, 2);
    return v;
}

uint32_t read_u32(const uint8_t* p) {
    uint32_t v;
    std::memcpy(&v, p, 4);
    return v;
}

std::string read_tag(const uint8_t* p) {
    return {reinterpret_cast<const char*>(p), 4};
}

} // namespace

TEST_CASE("wav::encode", "[wav]") {
    constexpr uint32_t sample_rate = 16000;
    std::vector<int16_t> samples = {0, 100, -100, 32767, -32768};

    SECTION("HeaderMagic") {
        auto wav = wav::encode(samples, sample_rate);
        REQUIRE(read_tag(wav.data()) == "RIFF");
        REQUIRE(read_tag(wav.data() + 8) == "WAVE");
        REQUIRE(read_tag(wav.data() + 12) == "fmt ");
        REQUIRE(read_tag(wav.data() + 36) == "data");
    }

    SECTION("HeaderFields") {
        auto wav = wav::encode(samples, sample_rate);
        REQUIRE(wav.size() == wav::header_size + samples.size() * 2);

        REQUIRE(read_u32(wav.data() + 16) == 16);     // fmt chunk size
        REQUIRE(read_u16(wav.data() + 20) == 1);      // PCM
        REQUIRE(read_u16(wav.data() + 22) == 1);      // mono
        REQUIRE(read_u32(wav.data() + 24) == sample_rate);
        REQUIRE(read_u32(wav.data() + 28) == sample_rate * 2);
        REQUIRE(read_u16(wav.data() + 32) == 2);
        REQUIRE(read_u16(wav.data() + 34) == 16);

        uint32_t data_size = static_cast<uint32_t>(samples.size() * 2);
        REQUIRE(read_u32(wav.data() + 40) == data_size);
        REQUIRE(read_u32(wav.data() + 4) == 36 + data_size);
    }

    SECTION("DataIntegrity") {
        auto wav = wav::encode(samples, sample_rate);
        std::vector<int16_t> decoded(samples.size());
        std::memcpy(decoded.data(), wav.data() + wav::header_size, samples.size() * 2);
        REQUIRE(decoded == samples);
    }

    SECTION("EmptySamples") {
        std::vector<int16_t> empty;
        auto wav = wav::encode(empty, sample_rate);
        REQUIRE(wav.size() == wav::header_size);
        REQUIRE(read_u32(wav.data() + 40) == 0);
    }
}

TEST_CASE("wav helpers", "[wav]") {
    using Catch::Matchers::WithinAbs;

    SECTION("Duration") {
        REQUIRE_THAT(wav::duration_seconds(8000, 16000), WithinAbs(0.5, 1e-9));
        REQUIRE_THAT(wav::duration_seconds(0, 16000), WithinAbs(0.0, 1e-9));
        REQUIRE_THAT(wav::duration_seconds(100, 0), WithinAbs(0.0, 1e-9));
    }

    SECTION("WriteFile") {
        auto path = std::filesystem::temp_directory_path() /
                    ("ps_test_wav_" + std::to_string(getpid()) + ".wav");
        std::vector<int16_t> samples(1600, 7);

        REQUIRE(wav::write_file(path.string(), samples, 16000));

        std::ifstream f(path, std::ios::binary);
        std::vector<uint8_t> bytes((std::istreambuf_iterator<char>(f)),
                                   std::istreambuf_iterator<char>());
        REQUIRE(bytes == wav::encode(samples, 16000));
        std::filesystem::remove(path);
    }

    SECTION("WriteFileBadPath") {
        std::vector<int16_t> samples(10, 0);
        auto res = wav::write_file("/nonexistent-dir/x.wav", samples, 16000);
        REQUIRE_FALSE(res);
        REQUIRE(res.error().find("/nonexistent-dir/x.wav") != std::string::npos);
    }
}
