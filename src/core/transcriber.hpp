#pragma once

#include "config.hpp"
#include "model/model_fetcher.hpp"
#include "model/model_resolver.hpp"
#include "whisper/backend.hpp"

#include <expected>
#include <memory>
#include <string>

// Model selection plus file transcription over one inference backend.
class Transcriber {
public:
    Transcriber(Config config, std::unique_ptr<InferenceBackend> backend,
                std::unique_ptr<ModelFetcher> fetcher, bool verbose = false);

    // Backend from config, models fetched over HTTP.
    static std::expected<std::unique_ptr<Transcriber>, std::string>
        create(Config config, bool verbose = false);

    Transcriber(const Transcriber&) = delete;
    Transcriber& operator=(const Transcriber&) = delete;

    std::expected<ModelHandle, std::string> load_model(const std::string& name,
                                                       const FetchProgress& progress = {});

    std::expected<Transcript, std::string> transcribe_file(const std::string& path,
                                                           const InferenceProgress& progress = {});

    void cancel() { backend_->cancel(); }
    // Drops a cancel left over from an earlier job.
    void reset_cancel() { backend_->reset_cancel(); }

    bool has_model() const { return !current_model_.empty(); }
    const std::string& current_model() const { return current_model_; }
    bool model_available(const std::string& name) const { return resolver_.is_available(name); }
    std::string backend_name() const { return backend_->name(); }
    const Config& config() const { return config_; }

private:
    TranscribeOptions options() const;
    void log(const std::string& msg);

    Config config_;
    std::unique_ptr<InferenceBackend> backend_;
    std::unique_ptr<ModelFetcher> fetcher_;
    ModelResolver resolver_;
    std::string current_model_;
    bool verbose_;
};
