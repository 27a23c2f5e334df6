#pragma once

#include <cstdint>
#include <expected>
#include <span>
#include <string>
#include <vector>

namespace wav {

struct DecodedAudio {
    uint32_t sample_rate = 0;
    uint16_t channels = 0;
    std::vector<float> samples; // mono, channels averaged
};

// Integer PCM of 8/16/24/32 bits and 32-bit float, plain or extensible.
std::expected<DecodedAudio, std::string> decode(std::span<const uint8_t> bytes);

} // namespace wav
