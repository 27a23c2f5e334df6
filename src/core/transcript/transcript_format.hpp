#pragma once

#include "transcript.hpp"

#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

enum class OutputFormat { Text, Json, Srt, Vtt };

namespace transcript {

std::string trim(std::string_view s);

std::optional<OutputFormat> parse_format(std::string_view name);
std::string_view format_name(OutputFormat format);
// File extension used when saving, without the dot.
std::string_view format_extension(OutputFormat format);

// "[1.00s -> 2.50s]", or "[1.00s]" when the segment end is unknown.
std::string format_timestamp(const Segment& seg);

std::string to_text(const Transcript& t);
nlohmann::json to_json(const Transcript& t);
std::string to_srt(const Transcript& t);
std::string to_vtt(const Transcript& t);

std::string render(const Transcript& t, OutputFormat format);

// Styled runs for the GUI output pane.
enum class BlockStyle { Header, Timestamp, Text, Spacing };

struct DisplayBlock {
    BlockStyle style;
    std::string content;
};

std::vector<DisplayBlock> display_blocks(const Transcript& t);

} // namespace transcript
