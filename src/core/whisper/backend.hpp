#pragma once

#include "../model/model_resolver.hpp"
#include "../transcript/transcript.hpp"

#include <cstdint>
#include <expected>
#include <functional>
#include <span>
#include <string>

struct TranscribeOptions {
    std::string language = "en"; // "auto" lets the model detect it
    bool translate = false;
    int threads = 4;
};

// Percent complete, 0..100.
using InferenceProgress = std::function<void(int percent)>;

// Both engines consume 16 kHz mono PCM.
constexpr uint32_t kInferenceSampleRate = 16000;

class InferenceBackend {
public:
    virtual ~InferenceBackend() = default;

    virtual std::string name() const = 0;

    // False for backends whose weights live elsewhere (e.g. a server).
    virtual bool needs_model_file() const { return true; }

    virtual std::expected<void, std::string> load_model(const ModelHandle& model) = 0;

    virtual std::expected<Transcript, std::string>
        transcribe(std::span<const float> pcm, uint32_t sample_rate,
                   const TranscribeOptions& opts, const InferenceProgress& progress) = 0;

    // Asks the current or next transcribe() to stop. Callable from any thread;
    // the request stays pending until reset_cancel().
    virtual void cancel() = 0;
    // Clears a pending cancel. Called once per job, before audio is decoded.
    virtual void reset_cancel() = 0;
};
