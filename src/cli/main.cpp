#include "cli_options.hpp"

#include "config.hpp"
#include "model/model_catalog.hpp"
#include "storage/history_db.hpp"
#include "transcriber.hpp"
#include "transcript/transcript_format.hpp"

#include <cstdio>
#include <format>
#include <fstream>
#include <print>
#include <string>
#include <unistd.h>
#include <vector>

namespace {

int list_models(const Transcriber& transcriber) {
    std::println("{:<10} {:>6}  {}", "MODEL", "PARAMS", "STATUS");
    for (const auto& m : catalog::models()) {
        bool local = transcriber.model_available(std::string(m.name));
        std::println("{:<10} {:>6}  {}{}", m.name, m.params, local ? "downloaded" : "-",
                     m.name == catalog::default_model() ? " (default)" : "");
    }
    std::println("Models directory: {}", transcriber.config().models_dir());
    return 0;
}

int show_history(int limit) {
    HistoryDb db;
    if (!db.open(HistoryDb::default_path())) {
        std::println(stderr, "Error: history is unavailable");
        return 1;
    }
    for (auto& e : db.recent(limit)) {
        std::println("[{}] {} ({}, {:.1f}s)", e.timestamp, e.file_path, e.model, e.audio_duration);
        std::println("  {}", e.text);
    }
    return 0;
}

std::string human_bytes(uint64_t n) {
    return std::format("{:.1f} MB", static_cast<double>(n) / (1024.0 * 1024.0));
}

} // namespace

int main(int argc, char* argv[]) {
    std::vector<std::string> args(argv + 1, argv + argc);
    auto parsed = parse_cli(args);
    if (!parsed) {
        std::println(stderr, "Error: {}", parsed.error());
        std::println(stderr, "Run '{} --help' for usage.", argv[0]);
        return 2;
    }
    const CliOptions& opts = *parsed;

    if (opts.help) {
        print_usage(argv[0]);
        return 0;
    }

    if (opts.history) {
        return show_history(*opts.history);
    }

    // Load config
    Config config = opts.config_path.empty() ? Config::load_default() : Config::load(opts.config_path);
    opts.apply_to(config);

    auto format = transcript::parse_format(config.output.format);
    if (!format) {
        std::println(stderr, "Error: unknown output format '{}' in config", config.output.format);
        return 2;
    }

    auto transcriber = Transcriber::create(config, opts.verbose);
    if (!transcriber) {
        std::println(stderr, "Error: {}", transcriber.error());
        return 1;
    }

    if (opts.list_models) {
        return list_models(**transcriber);
    }

    const bool interactive = ::isatty(STDERR_FILENO);
    const std::string model = config.model.default_name;

    std::println(stderr, "Using {} model...", model);
    std::println(stderr, "Downloading/Loading {} model...", model);

    int last_pct = -1;
    auto loaded = (*transcriber)->load_model(model, [&](uint64_t now, uint64_t total) {
        if (!interactive || total == 0) return true;
        int pct = static_cast<int>(now * 100 / total);
        if (pct != last_pct) {
            last_pct = pct;
            std::print(stderr, "\rDownloading: {:3}% ({} / {})", pct, human_bytes(now), human_bytes(total));
        }
        return true;
    });
    if (last_pct >= 0) std::println(stderr, "");

    if (!loaded) {
        std::println(stderr, "Error: {}", loaded.error());
        return 1;
    }
    std::println(stderr, "Model loaded successfully!");

    int last_inference_pct = -1;
    auto result = (*transcriber)->transcribe_file(opts.file, [&](int pct) {
        if (!interactive || pct == last_inference_pct) return;
        last_inference_pct = pct;
        std::print(stderr, "\rTranscribing: {:3}%", pct);
    });
    if (last_inference_pct >= 0) std::println(stderr, "");

    if (!result) {
        std::println(stderr, "Error transcribing audio: {}", result.error());
        return 1;
    }

    if (config.history.enabled) {
        HistoryDb db;
        if (db.open(HistoryDb::default_path())) {
            if (!db.insert(opts.file, model, (*transcriber)->backend_name(), *result)) {
                std::println(stderr, "Warning: could not record transcription in history");
            }
        }
    }

    auto rendered = transcript::render(*result, *format);
    if (opts.output_path.empty()) {
        std::print("{}", rendered);
        return 0;
    }

    std::ofstream out(opts.output_path, std::ios::trunc);
    if (!out.is_open()) {
        std::println(stderr, "Error: cannot write {}", opts.output_path);
        return 1;
    }
    out << rendered;
    if (!out) {
        std::println(stderr, "Error: write to {} failed", opts.output_path);
        return 1;
    }
    std::println(stderr, "Wrote {}", opts.output_path);
    return 0;
}
