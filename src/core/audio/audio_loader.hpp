#pragma once

#include <cstdint>
#include <expected>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace audio {

// Loads an audio file as mono float PCM at sample_rate. WAV is decoded
// in-process; everything else goes through ffmpeg.
std::expected<std::vector<float>, std::string>
    load_file(const std::string& path, const std::string& ffmpeg = "ffmpeg",
              uint32_t sample_rate = 16000);

std::expected<std::vector<float>, std::string>
    decode_with_ffmpeg(const std::string& path, const std::string& ffmpeg,
                       uint32_t sample_rate);

// Lowercase extensions without the dot, for file dialogs.
std::span<const std::string_view> supported_extensions();

} // namespace audio
