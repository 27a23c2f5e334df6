#pragma once

#include "backend.hpp"

#include <atomic>
#include <string>

// Sends audio to a whisper.cpp server or an OpenAI-compatible endpoint.
class LanBackend : public InferenceBackend {
public:
    // api_format: "whisper.cpp" or "openai"
    LanBackend(std::string url, std::string api_format = "whisper.cpp",
               std::string remote_model = "whisper-1", bool verbose = false);
    ~LanBackend() override;

    std::string name() const override { return "lan"; }
    bool needs_model_file() const override { return false; }

    std::expected<void, std::string> load_model(const ModelHandle& model) override;

    void cancel() override { abort_.store(true, std::memory_order_relaxed); }
    void reset_cancel() override { abort_.store(false, std::memory_order_relaxed); }

    std::expected<Transcript, std::string>
        transcribe(std::span<const float> pcm, uint32_t sample_rate,
                   const TranscribeOptions& opts, const InferenceProgress& progress) override;

    // Parses a json or verbose_json transcription response.
    static std::expected<Transcript, std::string> parse_response(const std::string& body);

private:
    void log(const std::string& msg);

    std::string url_;
    std::string api_format_;
    std::string remote_model_;
    bool verbose_;
    std::atomic<bool> abort_{false};
};
