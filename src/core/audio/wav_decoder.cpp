#include "wav_decoder.hpp"

#include <cstring>
#include <format>

namespace wav {

namespace {

constexpr uint16_t kFormatPcm = 1;
constexpr uint16_t kFormatFloat = 3;
constexpr uint16_t kFormatExtensible = 0xFFFE;

uint16_t rd16(const uint8_t* p) {
    return static_cast<uint16_t>(p[0] | (p[1] << 8));
}

uint32_t rd32(const uint8_t* p) {
    return static_cast<uint32_t>(p[0]) | (static_cast<uint32_t>(p[1]) << 8) |
           (static_cast<uint32_t>(p[2]) << 16) | (static_cast<uint32_t>(p[3]) << 24);
}

float sample_at(const uint8_t* p, uint16_t format, uint16_t bits) {
    if (format == kFormatFloat) {
        float f;
        std::memcpy(&f, p, sizeof(f));
        return f;
    }
    switch (bits) {
        case 8:
            return (static_cast<float>(p[0]) - 128.0f) / 128.0f;
        case 16:
            return static_cast<float>(static_cast<int16_t>(rd16(p))) / 32768.0f;
        case 24: {
            int32_t v = static_cast<int32_t>(p[0] | (p[1] << 8) | (p[2] << 16));
            if (v & 0x800000) v |= ~0xFFFFFF;
            return static_cast<float>(v) / 8388608.0f;
        }
        case 32:
            return static_cast<float>(static_cast<int32_t>(rd32(p))) / 2147483648.0f;
    }
    return 0.0f;
}

} // namespace

std::expected<DecodedAudio, std::string> decode(std::span<const uint8_t> bytes) {
    if (bytes.size() < 12 || std::memcmp(bytes.data(), "RIFF", 4) != 0 ||
        std::memcmp(bytes.data() + 8, "WAVE", 4) != 0) {
        return std::unexpected("not a RIFF/WAVE file");
    }

    uint16_t format = 0;
    uint16_t channels = 0;
    uint32_t sample_rate = 0;
    uint16_t bits = 0;
    bool have_fmt = false;
    const uint8_t* data = nullptr;
    size_t data_size = 0;

    size_t pos = 12;
    while (pos + 8 <= bytes.size()) {
        const uint8_t* chunk = bytes.data() + pos;
        uint32_t chunk_size = rd32(chunk + 4);
        size_t body = pos + 8;
        size_t avail = bytes.size() - body;

        if (std::memcmp(chunk, "fmt ", 4) == 0) {
            if (chunk_size < 16 || avail < 16) return std::unexpected("truncated fmt chunk");
            const uint8_t* f = bytes.data() + body;
            format = rd16(f);
            channels = rd16(f + 2);
            sample_rate = rd32(f + 4);
            bits = rd16(f + 14);
            if (format == kFormatExtensible) {
                if (chunk_size < 40 || avail < 40) return std::unexpected("truncated extensible fmt chunk");
                format = rd16(f + 24); // leading bytes of the subformat GUID
            }
            have_fmt = true;
        } else if (std::memcmp(chunk, "data", 4) == 0) {
            data = bytes.data() + body;
            // Streams written without a final size report 0 or 0xFFFFFFFF.
            data_size = (chunk_size == 0 || chunk_size > avail) ? avail : chunk_size;
            break;
        }

        pos = body + chunk_size + (chunk_size & 1);
    }

    if (!have_fmt) return std::unexpected("missing fmt chunk");
    if (!data) return std::unexpected("missing data chunk");
    if (channels == 0 || sample_rate == 0) return std::unexpected("invalid fmt chunk");

    bool supported = (format == kFormatPcm && (bits == 8 || bits == 16 || bits == 24 || bits == 32)) ||
                     (format == kFormatFloat && bits == 32);
    if (!supported) {
        return std::unexpected(std::format("unsupported WAV encoding (format {}, {} bits)", format, bits));
    }

    size_t frame_bytes = static_cast<size_t>(bits / 8) * channels;
    size_t frames = data_size / frame_bytes;

    DecodedAudio out;
    out.sample_rate = sample_rate;
    out.channels = channels;
    out.samples.resize(frames);

    for (size_t i = 0; i < frames; ++i) {
        const uint8_t* frame = data + i * frame_bytes;
        float sum = 0.0f;
        for (uint16_t c = 0; c < channels; ++c) {
            sum += sample_at(frame + c * (bits / 8), format, bits);
        }
        out.samples[i] = sum / static_cast<float>(channels);
    }

    return out;
}

} // namespace wav
