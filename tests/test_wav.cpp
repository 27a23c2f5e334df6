#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include "audio/wav_decoder.hpp"
#include "audio/wav_encoder.hpp"

#include <cstdint>
#include <cstring>
#include <string>
#include <vector>

using Catch::Matchers::WithinAbs;

namespace {

// Read a little-endian uint16 from raw bytes.
uint16_t read_u16(const uint8_t* p) {
    uint16_t v;
    std::memcpy(&v, p, 2);
    return v;
}

// Read a little-endian uint32 from raw bytes.
uint32_t read_u32(const uint8_t* p) {
    uint32_t v;
    std::memcpy(&v, p, 4);
    return v;
}

std::string read_tag(const uint8_t* p) {
    return {reinterpret_cast<const char*>(p), 4};
}

void put16(std::vector<uint8_t>& out, uint16_t v) {
    out.push_back(static_cast<uint8_t>(v & 0xFF));
    out.push_back(static_cast<uint8_t>(v >> 8));
}

void put32(std::vector<uint8_t>& out, uint32_t v) {
    for (int i = 0; i < 4; ++i) out.push_back(static_cast<uint8_t>((v >> (8 * i)) & 0xFF));
}

void put_tag(std::vector<uint8_t>& out, const char* tag) {
    out.insert(out.end(), tag, tag + 4);
}

// Hand-built WAV with an arbitrary format and raw sample bytes.
std::vector<uint8_t> build_wav(uint16_t format, uint16_t channels, uint32_t rate, uint16_t bits,
                               const std::vector<uint8_t>& data, bool with_list_chunk = false) {
    std::vector<uint8_t> out;
    put_tag(out, "RIFF");
    put32(out, 0); // patched below
    put_tag(out, "WAVE");
    put_tag(out, "fmt ");
    put32(out, 16);
    put16(out, format);
    put16(out, channels);
    put32(out, rate);
    put32(out, rate * channels * bits / 8);
    put16(out, static_cast<uint16_t>(channels * bits / 8));
    put16(out, bits);
    if (with_list_chunk) {
        put_tag(out, "LIST");
        put32(out, 3);
        out.insert(out.end(), {'a', 'b', 'c', 0}); // odd size plus pad byte
    }
    put_tag(out, "data");
    put32(out, static_cast<uint32_t>(data.size()));
    out.insert(out.end(), data.begin(), data.end());
    uint32_t riff = static_cast<uint32_t>(out.size() - 8);
    std::memcpy(out.data() + 4, &riff, 4);
    return out;
}

// WAVE_FORMAT_EXTENSIBLE header: 40-byte fmt chunk whose subformat GUID
// starts with the real format code.
std::vector<uint8_t> build_extensible_wav(uint16_t subformat, uint16_t channels, uint32_t rate,
                                          uint16_t bits, const std::vector<uint8_t>& data) {
    std::vector<uint8_t> out;
    put_tag(out, "RIFF");
    put32(out, 0); // patched below
    put_tag(out, "WAVE");
    put_tag(out, "fmt ");
    put32(out, 40);
    put16(out, 0xFFFE);
    put16(out, channels);
    put32(out, rate);
    put32(out, rate * channels * bits / 8);
    put16(out, static_cast<uint16_t>(channels * bits / 8));
    put16(out, bits);
    put16(out, 22);   // extension size
    put16(out, bits); // valid bits
    put32(out, channels == 2 ? 0x3 : 0x4);
    put16(out, subformat);
    out.insert(out.end(), {0x00, 0x00, 0x00, 0x00, 0x10, 0x00, 0x80, 0x00, 0x00, 0xAA, 0x00, 0x38, 0x9B, 0x71});
    put_tag(out, "data");
    put32(out, static_cast<uint32_t>(data.size()));
    out.insert(out.end(), data.begin(), data.end());
    uint32_t riff = static_cast<uint32_t>(out.size() - 8);
    std::memcpy(out.data() + 4, &riff, 4);
    return out;
}

} // namespace

TEST_CASE("wav::encode", "[wav]") {
    constexpr uint32_t sample_rate = 16000;
    std::vector<float> samples = {0.0f, 0.5f, -0.5f, 1.0f, -1.0f};

    SECTION("HeaderMagic") {
        auto wav = wav::encode(samples, sample_rate);
        REQUIRE(read_tag(wav.data()) == "RIFF");
        REQUIRE(read_tag(wav.data() + 8) == "WAVE");
        REQUIRE(read_tag(wav.data() + 12) == "fmt ");
        REQUIRE(read_tag(wav.data() + 36) == "data");
    }

    SECTION("HeaderFields") {
        auto wav = wav::encode(samples, sample_rate);
        REQUIRE(wav.size() == 44 + samples.size() * 2);

        // PCM format
        REQUIRE(read_u16(wav.data() + 20) == 1);
        // channels
        REQUIRE(read_u16(wav.data() + 22) == 1);
        REQUIRE(read_u32(wav.data() + 24) == sample_rate);
        // byte rate = sample_rate * channels * bits/8
        REQUIRE(read_u32(wav.data() + 28) == sample_rate * 2);
        REQUIRE(read_u16(wav.data() + 34) == 16);
        uint32_t data_size = static_cast<uint32_t>(samples.size() * 2);
        REQUIRE(read_u32(wav.data() + 40) == data_size);
        // RIFF chunk size = file_size - 8 = 36 + data_size
        REQUIRE(read_u32(wav.data() + 4) == 36 + data_size);
    }

    SECTION("SampleConversion") {
        REQUIRE(wav::to_pcm16(0.0f) == 0);
        REQUIRE(wav::to_pcm16(1.0f) == 32767);
        REQUIRE(wav::to_pcm16(-1.0f) == -32767);
        // Out of range input is clamped
        REQUIRE(wav::to_pcm16(3.0f) == 32767);
        REQUIRE(wav::to_pcm16(-3.0f) == -32767);
    }

    SECTION("EmptySamples") {
        std::vector<float> empty;
        auto wav = wav::encode(empty, sample_rate);
        REQUIRE(wav.size() == 44);
        REQUIRE(read_u32(wav.data() + 40) == 0);
    }
}

TEST_CASE("wav::decode", "[wav]") {

    SECTION("ReadsEncoderOutput") {
        std::vector<float> samples = {0.0f, 0.25f, -0.25f, 0.75f};
        auto bytes = wav::encode(samples, 16000);

        auto decoded = wav::decode(bytes);
        REQUIRE(decoded.has_value());
        REQUIRE(decoded->sample_rate == 16000);
        REQUIRE(decoded->channels == 1);
        REQUIRE(decoded->samples.size() == samples.size());
        for (size_t i = 0; i < samples.size(); ++i) {
            REQUIRE_THAT(decoded->samples[i], WithinAbs(samples[i], 1e-3));
        }
    }

    SECTION("StereoAveragedToMono") {
        std::vector<uint8_t> data;
        // Frame 1: L = 16384, R = 0. Frame 2: L = -16384, R = -16384.
        put16(data, 16384);
        put16(data, 0);
        put16(data, static_cast<uint16_t>(-16384));
        put16(data, static_cast<uint16_t>(-16384));

        auto decoded = wav::decode(build_wav(1, 2, 44100, 16, data));
        REQUIRE(decoded.has_value());
        REQUIRE(decoded->channels == 2);
        REQUIRE(decoded->sample_rate == 44100);
        REQUIRE(decoded->samples.size() == 2);
        REQUIRE_THAT(decoded->samples[0], WithinAbs(0.25, 1e-4));
        REQUIRE_THAT(decoded->samples[1], WithinAbs(-0.5, 1e-4));
    }

    SECTION("EightBitUnsigned") {
        std::vector<uint8_t> data = {128, 255, 0};
        auto decoded = wav::decode(build_wav(1, 1, 8000, 8, data));
        REQUIRE(decoded.has_value());
        REQUIRE(decoded->samples.size() == 3);
        REQUIRE_THAT(decoded->samples[0], WithinAbs(0.0, 1e-6));
        REQUIRE(decoded->samples[1] > 0.99f);
        REQUIRE_THAT(decoded->samples[2], WithinAbs(-1.0, 1e-6));
    }

    SECTION("TwentyFourBitNegative") {
        // -4194304 = 0xC00000, which is -0.5 at full scale
        std::vector<uint8_t> data = {0x00, 0x00, 0xC0};
        auto decoded = wav::decode(build_wav(1, 1, 16000, 24, data));
        REQUIRE(decoded.has_value());
        REQUIRE(decoded->samples.size() == 1);
        REQUIRE_THAT(decoded->samples[0], WithinAbs(-0.5, 1e-6));
    }

    SECTION("Float32") {
        std::vector<uint8_t> data(8);
        float a = 0.125f, b = -0.5f;
        std::memcpy(data.data(), &a, 4);
        std::memcpy(data.data() + 4, &b, 4);
        auto decoded = wav::decode(build_wav(3, 1, 16000, 32, data));
        REQUIRE(decoded.has_value());
        REQUIRE(decoded->samples.size() == 2);
        REQUIRE(decoded->samples[0] == 0.125f);
        REQUIRE(decoded->samples[1] == -0.5f);
    }

    SECTION("ExtensiblePcm") {
        std::vector<uint8_t> data;
        put16(data, 16384);
        put16(data, static_cast<uint16_t>(-16384));
        put16(data, 8192);
        put16(data, 8192);
        auto decoded = wav::decode(build_extensible_wav(1, 2, 48000, 16, data));
        REQUIRE(decoded.has_value());
        REQUIRE(decoded->sample_rate == 48000);
        REQUIRE(decoded->channels == 2);
        REQUIRE(decoded->samples.size() == 2);
        REQUIRE_THAT(decoded->samples[0], WithinAbs(0.0, 1e-6));
        REQUIRE_THAT(decoded->samples[1], WithinAbs(0.25, 1e-4));
    }

    SECTION("ExtensibleFloat") {
        std::vector<uint8_t> data(8);
        float a = 0.75f, b = -0.125f;
        std::memcpy(data.data(), &a, 4);
        std::memcpy(data.data() + 4, &b, 4);
        auto decoded = wav::decode(build_extensible_wav(3, 1, 16000, 32, data));
        REQUIRE(decoded.has_value());
        REQUIRE(decoded->samples.size() == 2);
        REQUIRE(decoded->samples[0] == 0.75f);
        REQUIRE(decoded->samples[1] == -0.125f);
    }

    SECTION("ExtensibleUnsupportedSubformat") {
        std::vector<uint8_t> data = {0, 0};
        auto decoded = wav::decode(build_extensible_wav(7, 1, 8000, 8, data));
        REQUIRE_FALSE(decoded.has_value());
        REQUIRE(decoded.error() == "unsupported WAV encoding (format 7, 8 bits)");
    }

    SECTION("TruncatedExtensibleHeader") {
        auto bytes = build_extensible_wav(1, 1, 16000, 16, {});
        bytes.resize(12 + 8 + 30); // fmt chunk cut short
        auto decoded = wav::decode(bytes);
        REQUIRE_FALSE(decoded.has_value());
        REQUIRE(decoded.error() == "truncated extensible fmt chunk");
    }

    SECTION("SkipsUnknownChunks") {
        std::vector<uint8_t> data;
        put16(data, 16384);
        auto decoded = wav::decode(build_wav(1, 1, 16000, 16, data, true));
        REQUIRE(decoded.has_value());
        REQUIRE(decoded->samples.size() == 1);
        REQUIRE_THAT(decoded->samples[0], WithinAbs(0.5, 1e-4));
    }

    SECTION("StreamingDataSize") {
        std::vector<uint8_t> data;
        put16(data, 0);
        put16(data, 0);
        auto bytes = build_wav(1, 1, 16000, 16, data);
        // Writers that never seek back leave the size as 0xFFFFFFFF
        uint32_t unknown = 0xFFFFFFFF;
        std::memcpy(bytes.data() + 40, &unknown, 4);
        auto decoded = wav::decode(bytes);
        REQUIRE(decoded.has_value());
        REQUIRE(decoded->samples.size() == 2);
    }

    SECTION("RejectsNonWav") {
        std::vector<uint8_t> junk = {'I', 'D', '3', 4, 0, 0, 0, 0, 0, 0, 0, 0, 0};
        auto decoded = wav::decode(junk);
        REQUIRE_FALSE(decoded.has_value());
        REQUIRE(decoded.error() == "not a RIFF/WAVE file");
    }

    SECTION("RejectsUnsupportedEncoding") {
        // A-law
        std::vector<uint8_t> data = {1, 2};
        auto decoded = wav::decode(build_wav(6, 1, 8000, 8, data));
        REQUIRE_FALSE(decoded.has_value());
        REQUIRE(decoded.error() == "unsupported WAV encoding (format 6, 8 bits)");
    }

    SECTION("MissingDataChunk") {
        auto bytes = build_wav(1, 1, 16000, 16, {});
        bytes.resize(bytes.size() - 8); // drop the data header
        auto decoded = wav::decode(bytes);
        REQUIRE_FALSE(decoded.has_value());
        REQUIRE(decoded.error() == "missing data chunk");
    }
}
