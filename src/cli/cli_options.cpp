#include "cli_options.hpp"

#include "model/model_catalog.hpp"

#include <charconv>
#include <print>

namespace {

std::optional<int> parse_int(const std::string& s) {
    int v = 0;
    auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), v);
    if (ec != std::errc() || ptr != s.data() + s.size()) return std::nullopt;
    return v;
}

} // namespace

void CliOptions::apply_to(Config& config) const {
    if (!model.empty()) config.model.default_name = model;
    if (models_dir) config.model.dir = *models_dir;
    if (offline) config.model.offline = true;
    if (backend) config.backend.type = *backend;
    if (url) config.backend.url = *url;
    if (language) config.backend.language = *language;
    if (threads) config.backend.threads = *threads;
    if (translate) config.backend.translate = true;
    if (no_gpu) config.backend.use_gpu = false;
    if (format) config.output.format = std::string(transcript::format_name(*format));
}

std::expected<CliOptions, std::string> parse_cli(const std::vector<std::string>& args) {
    CliOptions opts;
    bool file_set = false;

    for (size_t i = 0; i < args.size(); i++) {
        const std::string& arg = args[i];

        auto value = [&](const char* flag) -> std::expected<std::string, std::string> {
            if (i + 1 >= args.size()) {
                return std::unexpected(std::string(flag) + " requires a value");
            }
            return args[++i];
        };

        if (arg == "--help" || arg == "-h") {
            opts.help = true;
        } else if (arg == "--verbose" || arg == "-v") {
            opts.verbose = true;
        } else if (arg == "--list-models") {
            opts.list_models = true;
        } else if (arg == "--translate") {
            opts.translate = true;
        } else if (arg == "--offline") {
            opts.offline = true;
        } else if (arg == "--no-gpu") {
            opts.no_gpu = true;
        } else if (arg == "--history") {
            opts.history = 10;
            if (i + 1 < args.size()) {
                if (auto n = parse_int(args[i + 1])) {
                    opts.history = *n;
                    ++i;
                }
            }
        } else if (arg == "--config" || arg == "-c") {
            auto v = value("--config");
            if (!v) return std::unexpected(v.error());
            opts.config_path = *v;
        } else if (arg == "--model" || arg == "-m") {
            auto v = value("--model");
            if (!v) return std::unexpected(v.error());
            if (!v->ends_with(".bin")) {
                if (auto info = catalog::find(*v); !info) return std::unexpected(info.error());
            }
            opts.model = *v;
        } else if (arg == "--file" || arg == "-f") {
            auto v = value("--file");
            if (!v) return std::unexpected(v.error());
            opts.file = *v;
            file_set = true;
        } else if (arg == "--output" || arg == "-o") {
            auto v = value("--output");
            if (!v) return std::unexpected(v.error());
            opts.output_path = *v;
        } else if (arg == "--format" || arg == "-F") {
            auto v = value("--format");
            if (!v) return std::unexpected(v.error());
            opts.format = transcript::parse_format(*v);
            if (!opts.format) {
                return std::unexpected("unknown format '" + *v + "' (choices: text, json, srt, vtt)");
            }
        } else if (arg == "--language" || arg == "-l") {
            auto v = value("--language");
            if (!v) return std::unexpected(v.error());
            opts.language = *v;
        } else if (arg == "--threads" || arg == "-t") {
            auto v = value("--threads");
            if (!v) return std::unexpected(v.error());
            opts.threads = parse_int(*v);
            if (!opts.threads || *opts.threads < 1) {
                return std::unexpected("--threads expects a positive integer, got '" + *v + "'");
            }
        } else if (arg == "--backend") {
            auto v = value("--backend");
            if (!v) return std::unexpected(v.error());
            if (*v != "local" && *v != "lan") {
                return std::unexpected("unknown backend '" + *v + "' (choices: local, lan)");
            }
            opts.backend = *v;
        } else if (arg == "--url") {
            auto v = value("--url");
            if (!v) return std::unexpected(v.error());
            opts.url = *v;
        } else if (arg == "--models-dir") {
            auto v = value("--models-dir");
            if (!v) return std::unexpected(v.error());
            opts.models_dir = *v;
        } else if (!arg.empty() && arg[0] == '-') {
            return std::unexpected("unknown option '" + arg + "'");
        } else if (!file_set) {
            opts.file = arg;
            file_set = true;
        } else {
            return std::unexpected("unexpected argument '" + arg + "'");
        }
    }

    return opts;
}

void print_usage(const char* prog) {
    std::println("Usage: {} [options] [audio-file]", prog);
    std::println("Options:");
    std::println("  -m, --model NAME      Model size ({})", catalog::choices());
    std::println("  -f, --file PATH       Audio file to transcribe (default: test_audio_file.mp3)");
    std::println("  -F, --format FMT      Output format: text, json, srt, vtt");
    std::println("  -o, --output PATH     Write the transcript to PATH instead of stdout");
    std::println("  -l, --language LANG   Spoken language, or 'auto' to detect");
    std::println("  -t, --threads N       Inference threads");
    std::println("      --translate       Translate to English");
    std::println("      --backend TYPE    local (libwhisper) or lan (HTTP server)");
    std::println("      --url URL         Server URL for the lan backend");
    std::println("      --models-dir DIR  Model storage directory");
    std::println("      --offline         Never download models");
    std::println("      --no-gpu          Run inference on the CPU");
    std::println("      --list-models     List models and whether they are stored locally");
    std::println("      --history [N]     Show the N most recent transcriptions (default 10)");
    std::println("  -c, --config PATH     Config file path");
    std::println("  -v, --verbose         Enable verbose logging");
    std::println("  -h, --help            Show this help");
}
