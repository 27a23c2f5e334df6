#include "transcriber.hpp"

#include "audio/audio_loader.hpp"
#include "model/curl_fetcher.hpp"
#include "whisper/backend_factory.hpp"

#include <format>
#include <print>

Transcriber::Transcriber(Config config, std::unique_ptr<InferenceBackend> backend,
                         std::unique_ptr<ModelFetcher> fetcher, bool verbose)
    : config_(std::move(config)), backend_(std::move(backend)),
      fetcher_(std::move(fetcher)),
      resolver_(ModelResolver::Options{
                    .dir = config_.models_dir(),
                    .source = config_.model.source,
                    .revision = config_.model.revision,
                    .offline = config_.model.offline,
                },
                *fetcher_, verbose),
      verbose_(verbose) {}

std::expected<std::unique_ptr<Transcriber>, std::string>
Transcriber::create(Config config, bool verbose) {
    auto backend = make_backend(config, verbose);
    if (!backend) return std::unexpected(backend.error());
    return std::make_unique<Transcriber>(std::move(config), std::move(*backend),
                                         std::make_unique<CurlFetcher>(), verbose);
}

std::expected<ModelHandle, std::string>
Transcriber::load_model(const std::string& name, const FetchProgress& progress) {
    log(std::format("Loading {} model ({} backend)", name, backend_->name()));

    ModelHandle handle{.name = name};
    if (backend_->needs_model_file()) {
        auto resolved = resolver_.resolve(name, progress);
        if (!resolved) return std::unexpected(resolved.error());
        handle = std::move(*resolved);
    }

    auto loaded = backend_->load_model(handle);
    if (!loaded) return std::unexpected(loaded.error());

    current_model_ = name;
    return handle;
}

std::expected<Transcript, std::string>
Transcriber::transcribe_file(const std::string& path, const InferenceProgress& progress) {
    if (!has_model()) {
        return std::unexpected("no model loaded");
    }

    auto samples = audio::load_file(path, config_.audio.ffmpeg, kInferenceSampleRate);
    if (!samples) return std::unexpected(samples.error());

    log(std::format("Transcribing {} ({:.1f}s of audio)", path,
                    static_cast<double>(samples->size()) / kInferenceSampleRate));

    auto result = backend_->transcribe(*samples, kInferenceSampleRate, options(), progress);
    if (result) {
        log(std::format("Transcription complete: {:.1f}s processing, {} segments",
                        result->processing_s, result->segments.size()));
    }
    return result;
}

TranscribeOptions Transcriber::options() const {
    return TranscribeOptions{
        .language = config_.backend.language,
        .translate = config_.backend.translate,
        .threads = config_.backend.threads,
    };
}

void Transcriber::log(const std::string& msg) {
    if (verbose_) {
        std::println(stderr, "[whisperdesk] {}", msg);
    }
}
