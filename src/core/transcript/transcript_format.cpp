#include "transcript_format.hpp"

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <format>

namespace transcript {

namespace {

// End time for cue formats, which need one even when the engine left it open.
double resolved_end(const Transcript& t, size_t i) {
    const auto& seg = t.segments[i];
    if (seg.end_s) return *seg.end_s;
    if (i + 1 < t.segments.size()) return t.segments[i + 1].start_s;
    return std::max(seg.start_s, t.audio_duration_s);
}

std::string cue_time(double seconds, char ms_sep) {
    auto total_ms = static_cast<int64_t>(std::llround(std::max(0.0, seconds) * 1000.0));
    int64_t h = total_ms / 3'600'000;
    int64_t m = (total_ms / 60'000) % 60;
    int64_t s = (total_ms / 1000) % 60;
    int64_t ms = total_ms % 1000;
    return std::format("{:02}:{:02}:{:02}{}{:03}", h, m, s, ms_sep, ms);
}

} // namespace

std::string trim(std::string_view s) {
    auto start = s.find_first_not_of(" \t\n\r");
    if (start == std::string_view::npos) return {};
    auto end = s.find_last_not_of(" \t\n\r");
    return std::string(s.substr(start, end - start + 1));
}

std::optional<OutputFormat> parse_format(std::string_view name) {
    if (name == "text" || name == "txt") return OutputFormat::Text;
    if (name == "json") return OutputFormat::Json;
    if (name == "srt") return OutputFormat::Srt;
    if (name == "vtt") return OutputFormat::Vtt;
    return std::nullopt;
}

std::string_view format_name(OutputFormat format) {
    switch (format) {
        case OutputFormat::Text: return "text";
        case OutputFormat::Json: return "json";
        case OutputFormat::Srt: return "srt";
        case OutputFormat::Vtt: return "vtt";
    }
    return "text";
}

std::string_view format_extension(OutputFormat format) {
    if (format == OutputFormat::Text) return "txt";
    return format_name(format);
}

std::string format_timestamp(const Segment& seg) {
    if (seg.end_s) {
        return std::format("[{:.2f}s -> {:.2f}s]", seg.start_s, *seg.end_s);
    }
    return std::format("[{:.2f}s]", seg.start_s);
}

std::string to_text(const Transcript& t) {
    std::string out = "Transcription:\n";
    out += trim(t.text);
    out += "\n\nTimestamped chunks:\n";
    for (const auto& seg : t.segments) {
        out += format_timestamp(seg);
        out += ' ';
        out += trim(seg.text);
        out += '\n';
    }
    return out;
}

nlohmann::json to_json(const Transcript& t) {
    nlohmann::json j = {
        {"text", trim(t.text)},
        {"language", t.language},
        {"duration", t.audio_duration_s},
        {"processing_time", t.processing_s},
        {"chunks", nlohmann::json::array()},
    };
    for (const auto& seg : t.segments) {
        nlohmann::json end = seg.end_s ? nlohmann::json(*seg.end_s) : nlohmann::json(nullptr);
        j["chunks"].push_back({
            {"timestamp", {seg.start_s, end}},
            {"text", trim(seg.text)},
        });
    }
    return j;
}

std::string to_srt(const Transcript& t) {
    std::string out;
    for (size_t i = 0; i < t.segments.size(); ++i) {
        out += std::format("{}\n{} --> {}\n{}\n\n", i + 1,
                           cue_time(t.segments[i].start_s, ','),
                           cue_time(resolved_end(t, i), ','),
                           trim(t.segments[i].text));
    }
    return out;
}

std::string to_vtt(const Transcript& t) {
    std::string out = "WEBVTT\n\n";
    for (size_t i = 0; i < t.segments.size(); ++i) {
        out += std::format("{} --> {}\n{}\n\n",
                           cue_time(t.segments[i].start_s, '.'),
                           cue_time(resolved_end(t, i), '.'),
                           trim(t.segments[i].text));
    }
    return out;
}

std::string render(const Transcript& t, OutputFormat format) {
    switch (format) {
        case OutputFormat::Text: return to_text(t);
        case OutputFormat::Json: return to_json(t).dump(2) + "\n";
        case OutputFormat::Srt: return to_srt(t);
        case OutputFormat::Vtt: return to_vtt(t);
    }
    return to_text(t);
}

std::vector<DisplayBlock> display_blocks(const Transcript& t) {
    std::vector<DisplayBlock> blocks;
    blocks.push_back({BlockStyle::Header, "Full Transcription:\n"});
    blocks.push_back({BlockStyle::Spacing, "\n"});
    blocks.push_back({BlockStyle::Text, trim(t.text)});
    blocks.push_back({BlockStyle::Spacing, "\n\n\n"});

    blocks.push_back({BlockStyle::Header, "Timestamped Chunks:\n"});
    blocks.push_back({BlockStyle::Spacing, "\n"});

    for (const auto& seg : t.segments) {
        blocks.push_back({BlockStyle::Timestamp, format_timestamp(seg) + " "});
        blocks.push_back({BlockStyle::Text, trim(seg.text)});
        blocks.push_back({BlockStyle::Spacing, "\n\n"});
    }
    return blocks;
}

} // namespace transcript
