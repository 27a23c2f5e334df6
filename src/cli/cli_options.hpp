#pragma once

#include "config.hpp"
#include "transcript/transcript_format.hpp"

#include <expected>
#include <optional>
#include <string>
#include <vector>

struct CliOptions {
    std::string config_path;
    std::string model;
    std::string file = "test_audio_file.mp3";
    std::string output_path;
    std::optional<OutputFormat> format;
    std::optional<std::string> language;
    std::optional<int> threads;
    std::optional<std::string> backend;
    std::optional<std::string> url;
    std::optional<std::string> models_dir;
    bool translate = false;
    bool offline = false;
    bool no_gpu = false;
    bool verbose = false;
    bool list_models = false;
    bool help = false;
    std::optional<int> history;

    // Command-line values override the config file.
    void apply_to(Config& config) const;
};

std::expected<CliOptions, std::string> parse_cli(const std::vector<std::string>& args);

void print_usage(const char* prog);
