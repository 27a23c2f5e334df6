#include "whisper_cpp_backend.hpp"

#include "../transcript/transcript_format.hpp"

#include <atomic>
#include <chrono>
#include <format>
#include <print>
#include <whisper.h>

namespace {

std::atomic<bool> g_engine_logging{false};

// libwhisper and ggml write diagnostics through this hook; keep them quiet
// unless verbose output was requested.
void engine_log(enum ggml_log_level /*level*/, const char* text, void* /*user_data*/) {
    if (g_engine_logging.load(std::memory_order_relaxed) && text) {
        std::print(stderr, "{}", text);
    }
}

struct ProgressBridge {
    const InferenceProgress* progress;
};

void on_progress(whisper_context* /*ctx*/, whisper_state* /*state*/, int percent, void* user_data) {
    auto* bridge = static_cast<ProgressBridge*>(user_data);
    if (bridge->progress && *bridge->progress) {
        (*bridge->progress)(percent);
    }
}

bool should_abort(void* user_data) {
    return static_cast<std::atomic<bool>*>(user_data)->load(std::memory_order_relaxed);
}

} // namespace

WhisperCppBackend::WhisperCppBackend(bool use_gpu, bool verbose)
    : use_gpu_(use_gpu), verbose_(verbose) {
    g_engine_logging.store(verbose, std::memory_order_relaxed);
    whisper_log_set(engine_log, nullptr);
}

WhisperCppBackend::~WhisperCppBackend() {
    if (ctx_) whisper_free(ctx_);
}

std::expected<void, std::string> WhisperCppBackend::load_model(const ModelHandle& model) {
    if (ctx_ && model.path == model_path_) return {};

    whisper_context_params cparams = whisper_context_default_params();
    cparams.use_gpu = use_gpu_;

    whisper_context* ctx = whisper_init_from_file_with_params(model.path.c_str(), cparams);
    if (!ctx && use_gpu_) {
        log("GPU initialization failed, retrying on CPU");
        cparams.use_gpu = false;
        ctx = whisper_init_from_file_with_params(model.path.c_str(), cparams);
    }
    if (!ctx) {
        return std::unexpected("failed to load model from " + model.path);
    }

    if (ctx_) whisper_free(ctx_);
    ctx_ = ctx;
    model_path_ = model.path;
    log(std::format("Loaded {} ({})", model.name, whisper_model_type_readable(ctx_)));
    return {};
}

std::expected<Transcript, std::string>
WhisperCppBackend::transcribe(std::span<const float> pcm, uint32_t sample_rate,
                              const TranscribeOptions& opts, const InferenceProgress& progress) {
    if (!ctx_) {
        return std::unexpected("no model loaded");
    }
    if (pcm.empty()) {
        return std::unexpected("empty audio");
    }
    if (sample_rate != WHISPER_SAMPLE_RATE) {
        return std::unexpected(std::format("expected {} Hz audio, got {} Hz",
                                           WHISPER_SAMPLE_RATE, sample_rate));
    }
    if (opts.language != "auto" && whisper_lang_id(opts.language.c_str()) < 0) {
        return std::unexpected("unknown language '" + opts.language + "'");
    }

    if (abort_.load(std::memory_order_relaxed)) {
        return std::unexpected("transcription cancelled");
    }
    ProgressBridge bridge{&progress};

    whisper_full_params params = whisper_full_default_params(WHISPER_SAMPLING_GREEDY);
    params.n_threads = opts.threads;
    params.language = opts.language.c_str();
    params.translate = opts.translate;
    params.print_progress = false;
    params.print_realtime = false;
    params.print_timestamps = false;
    params.print_special = false;
    params.progress_callback = on_progress;
    params.progress_callback_user_data = &bridge;
    params.abort_callback = should_abort;
    params.abort_callback_user_data = &abort_;

    auto start = std::chrono::steady_clock::now();
    int rc = whisper_full(ctx_, params, pcm.data(), static_cast<int>(pcm.size()));
    auto end = std::chrono::steady_clock::now();

    if (abort_.load(std::memory_order_relaxed)) {
        return std::unexpected("transcription cancelled");
    }
    if (rc != 0) {
        return std::unexpected(std::format("whisper_full failed (code {})", rc));
    }

    Transcript result;
    const int n_segments = whisper_full_n_segments(ctx_);
    result.segments.reserve(static_cast<size_t>(n_segments));
    for (int i = 0; i < n_segments; ++i) {
        // Segment times are in 10 ms ticks.
        const int64_t t0 = whisper_full_get_segment_t0(ctx_, i);
        const int64_t t1 = whisper_full_get_segment_t1(ctx_, i);
        const char* text = whisper_full_get_segment_text(ctx_, i);
        result.text += text;
        result.segments.push_back(Segment{
            .start_s = static_cast<double>(t0) / 100.0,
            .end_s = static_cast<double>(t1) / 100.0,
            .text = transcript::trim(text),
        });
    }
    result.text = transcript::trim(result.text);
    const char* lang = whisper_lang_str(whisper_full_lang_id(ctx_));
    result.language = lang ? lang : "";
    result.audio_duration_s = static_cast<double>(pcm.size()) / sample_rate;
    result.processing_s = std::chrono::duration<double>(end - start).count();

    if (progress) progress(100);
    return result;
}

void WhisperCppBackend::log(const std::string& msg) {
    if (verbose_) {
        std::println(stderr, "[whisperdesk] {}", msg);
    }
}
