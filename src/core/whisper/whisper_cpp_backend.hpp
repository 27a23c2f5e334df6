#pragma once

#include "backend.hpp"

#include <atomic>
#include <string>

struct whisper_context;

// In-process inference through libwhisper.
class WhisperCppBackend : public InferenceBackend {
public:
    explicit WhisperCppBackend(bool use_gpu = true, bool verbose = false);
    ~WhisperCppBackend() override;

    WhisperCppBackend(const WhisperCppBackend&) = delete;
    WhisperCppBackend& operator=(const WhisperCppBackend&) = delete;

    std::string name() const override { return "local"; }

    std::expected<void, std::string> load_model(const ModelHandle& model) override;

    std::expected<Transcript, std::string>
        transcribe(std::span<const float> pcm, uint32_t sample_rate,
                   const TranscribeOptions& opts, const InferenceProgress& progress) override;

    void cancel() override { abort_.store(true, std::memory_order_relaxed); }
    void reset_cancel() override { abort_.store(false, std::memory_order_relaxed); }

private:
    void log(const std::string& msg);

    bool use_gpu_;
    bool verbose_;
    whisper_context* ctx_ = nullptr;
    std::string model_path_;
    std::atomic<bool> abort_{false};
};
