#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

namespace audio {

// Linear interpolation; adequate for speech going into a 16 kHz model.
inline std::vector<float> resample_linear(std::span<const float> in, uint32_t from_rate,
                                          uint32_t to_rate) {
    if (in.empty() || from_rate == to_rate || from_rate == 0 || to_rate == 0) {
        return {in.begin(), in.end()};
    }

    const double ratio = static_cast<double>(from_rate) / to_rate;
    const size_t out_len = static_cast<size_t>(static_cast<double>(in.size()) / ratio);
    std::vector<float> out(out_len);

    for (size_t i = 0; i < out_len; ++i) {
        double src = static_cast<double>(i) * ratio;
        size_t idx = static_cast<size_t>(src);
        double frac = src - static_cast<double>(idx);
        float a = in[idx];
        float b = idx + 1 < in.size() ? in[idx + 1] : a;
        out[i] = static_cast<float>(a + (b - a) * frac);
    }
    return out;
}

} // namespace audio
