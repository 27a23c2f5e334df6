#include "config.hpp"

#include "platform/platform_paths.hpp"

#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>
#include <print>

namespace fs = std::filesystem;
using json = nlohmann::json;

std::string Config::models_dir() const {
    if (!model.dir.empty()) return model.dir;
    auto cache = platform::cache_dir();
    if (cache.empty()) return "models";
    return cache + "/models";
}

Config Config::load(const std::string& path) {
    Config cfg;
    std::ifstream f(path);
    if (!f.is_open()) {
        std::println(stderr, "config: could not open {}, using defaults", path);
        return cfg;
    }

    try {
        auto j = json::parse(f);

        if (j.contains("model")) {
            auto& m = j["model"];
            if (m.contains("default")) cfg.model.default_name = m["default"].get<std::string>();
            if (m.contains("dir")) cfg.model.dir = m["dir"].get<std::string>();
            if (m.contains("source")) cfg.model.source = m["source"].get<std::string>();
            if (m.contains("revision")) cfg.model.revision = m["revision"].get<std::string>();
            if (m.contains("offline")) cfg.model.offline = m["offline"].get<bool>();
        }

        if (j.contains("backend")) {
            auto& b = j["backend"];
            if (b.contains("type")) cfg.backend.type = b["type"].get<std::string>();
            if (b.contains("url")) cfg.backend.url = b["url"].get<std::string>();
            if (b.contains("api_format")) cfg.backend.api_format = b["api_format"].get<std::string>();
            if (b.contains("remote_model")) cfg.backend.remote_model = b["remote_model"].get<std::string>();
            if (b.contains("language")) cfg.backend.language = b["language"].get<std::string>();
            if (b.contains("translate")) cfg.backend.translate = b["translate"].get<bool>();
            if (b.contains("threads")) cfg.backend.threads = std::max(1, b["threads"].get<int>());
            if (b.contains("use_gpu")) cfg.backend.use_gpu = b["use_gpu"].get<bool>();
        }

        if (j.contains("audio")) {
            auto& a = j["audio"];
            if (a.contains("ffmpeg")) cfg.audio.ffmpeg = a["ffmpeg"].get<std::string>();
            if (a.contains("sample_rate")) {
                // Whisper only takes 16 kHz input; decoding always resamples to it
                std::println(stderr, "config: audio.sample_rate is ignored, audio is decoded at 16000 Hz");
            }
        }

        if (j.contains("output")) {
            auto& o = j["output"];
            if (o.contains("format")) cfg.output.format = o["format"].get<std::string>();
        }

        if (j.contains("history")) {
            auto& h = j["history"];
            if (h.contains("enabled")) cfg.history.enabled = h["enabled"].get<bool>();
        }

    } catch (const json::exception& e) {
        std::println(stderr, "config: parse error: {}", e.what());
    }

    return cfg;
}

Config Config::load_default() {
    auto dir = platform::config_dir();
    if (dir.empty()) return Config{};

    auto config_path = fs::path(dir) / "config.json";
    if (fs::exists(config_path)) {
        return load(config_path.string());
    }
    return Config{};
}
