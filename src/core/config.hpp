#pragma once

#include <algorithm>
#include <string>
#include <thread>

struct Config {
    struct Model {
        std::string default_name = "small";
        std::string dir; // empty: <cache_dir>/models
        std::string source = "https://huggingface.co/ggerganov/whisper.cpp";
        std::string revision = "main";
        bool offline = false;
    } model;

    struct Backend {
        std::string type = "local"; // "local" (libwhisper) or "lan"
        std::string url = "http://localhost:8080";
        std::string api_format = "whisper.cpp"; // "whisper.cpp" or "openai"
        std::string remote_model = "whisper-1";
        std::string language = "en";
        bool translate = false;
        int threads = default_threads();
        bool use_gpu = true;

        static int default_threads() {
            return std::min(4, std::max(1, static_cast<int>(std::thread::hardware_concurrency())));
        }
    } backend;

    struct Audio {
        std::string ffmpeg = "ffmpeg";
    } audio;

    struct Output {
        std::string format = "text";
    } output;

    struct History {
        bool enabled = true;
    } history;

    // Model directory with the default applied.
    std::string models_dir() const;

    static Config load(const std::string& path);
    static Config load_default();
};
