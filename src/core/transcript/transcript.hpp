#pragma once

#include <optional>
#include <string>
#include <vector>

struct Segment {
    double start_s = 0.0;
    std::optional<double> end_s; // unknown for a trailing chunk
    std::string text;
};

struct Transcript {
    std::string text;
    std::vector<Segment> segments;
    std::string language;
    double audio_duration_s = 0.0;
    double processing_s = 0.0;
};
