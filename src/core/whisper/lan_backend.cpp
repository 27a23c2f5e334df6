#include "lan_backend.hpp"
#include "../audio/wav_encoder.hpp"
#include "../transcript/transcript_format.hpp"

#include <atomic>
#include <chrono>
#include <curl/curl.h>
#include <nlohmann/json.hpp>
#include <print>

using json = nlohmann::json;

static size_t write_callback(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* resp = static_cast<std::string*>(userdata);
    resp->append(ptr, size * nmemb);
    return size * nmemb;
}

// Stops the upload or the wait for the server once cancel() was called.
static int xferinfo_callback(void* userdata, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
    return static_cast<std::atomic<bool>*>(userdata)->load(std::memory_order_relaxed) ? 1 : 0;
}

static void add_field(curl_mime* mime, const char* name, const std::string& value) {
    curl_mimepart* part = curl_mime_addpart(mime);
    curl_mime_name(part, name);
    curl_mime_data(part, value.c_str(), CURL_ZERO_TERMINATED);
}

LanBackend::LanBackend(std::string url, std::string api_format, std::string remote_model,
                       bool verbose)
    : url_(std::move(url)), api_format_(std::move(api_format)),
      remote_model_(std::move(remote_model)), verbose_(verbose) {
    curl_global_init(CURL_GLOBAL_DEFAULT);
}

LanBackend::~LanBackend() {
    curl_global_cleanup();
}

std::expected<void, std::string> LanBackend::load_model(const ModelHandle& model) {
    // The server owns its weights; the selection is only logged.
    log("Using server model for '" + model.name + "' at " + url_);
    return {};
}

std::expected<Transcript, std::string>
LanBackend::transcribe(std::span<const float> pcm, uint32_t sample_rate,
                       const TranscribeOptions& opts, const InferenceProgress& progress) {
    if (pcm.empty()) {
        return std::unexpected("empty audio");
    }
    if (abort_.load(std::memory_order_relaxed)) {
        return std::unexpected("transcription cancelled");
    }

    double duration_s = static_cast<double>(pcm.size()) / sample_rate;

    auto wav_data = wav::encode(pcm, sample_rate);

    auto start = std::chrono::steady_clock::now();
    if (progress) progress(0);

    CURL* curl = curl_easy_init();
    if (!curl) {
        return std::unexpected("curl_easy_init failed");
    }

    // Build URL and form based on API format
    std::string endpoint;
    curl_mime* mime = curl_mime_init(curl);

    curl_mimepart* part = curl_mime_addpart(mime);
    curl_mime_name(part, "file");
    curl_mime_data(part, reinterpret_cast<const char*>(wav_data.data()), wav_data.size());
    curl_mime_filename(part, "audio.wav");
    curl_mime_type(part, "audio/wav");

    add_field(mime, "response_format", "verbose_json");

    if (api_format_ == "openai") {
        endpoint = url_ + (opts.translate ? "/v1/audio/translations" : "/v1/audio/transcriptions");
        add_field(mime, "model", remote_model_);
        if (opts.language != "auto" && !opts.translate) {
            add_field(mime, "language", opts.language);
        }
    } else {
        // whisper.cpp server format
        endpoint = url_ + "/inference";
        add_field(mime, "temperature", "0.0");
        if (!opts.language.empty()) add_field(mime, "language", opts.language);
        if (opts.translate) add_field(mime, "translate", "true");
    }

    std::string response_body;

    curl_easy_setopt(curl, CURLOPT_URL, endpoint.c_str());
    curl_easy_setopt(curl, CURLOPT_MIMEPOST, mime);
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response_body);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, 600L);
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, 10L);
    curl_easy_setopt(curl, CURLOPT_NOPROGRESS, 0L);
    curl_easy_setopt(curl, CURLOPT_XFERINFOFUNCTION, xferinfo_callback);
    curl_easy_setopt(curl, CURLOPT_XFERINFODATA, &abort_);

    log("POST " + endpoint);
    CURLcode res = curl_easy_perform(curl);

    long http_status = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &http_status);

    curl_mime_free(mime);
    curl_easy_cleanup(curl);

    auto end = std::chrono::steady_clock::now();

    if (res == CURLE_ABORTED_BY_CALLBACK) {
        return std::unexpected("transcription cancelled");
    }
    if (res != CURLE_OK) {
        return std::unexpected(std::string("curl error: ") + curl_easy_strerror(res));
    }

    auto result = parse_response(response_body);
    if (!result) {
        if (http_status >= 400) {
            return std::unexpected("HTTP " + std::to_string(http_status) + ": " + result.error());
        }
        return result;
    }

    // Plain json responses carry no segments; present the whole clip as one.
    if (result->segments.empty() && !result->text.empty()) {
        result->segments.push_back(Segment{.start_s = 0.0, .end_s = duration_s, .text = result->text});
    }
    result->audio_duration_s = duration_s;
    result->processing_s = std::chrono::duration<double>(end - start).count();
    if (result->language.empty() && opts.language != "auto") {
        result->language = opts.language;
    }
    if (progress) progress(100);
    return result;
}

std::expected<Transcript, std::string> LanBackend::parse_response(const std::string& body) {
    try {
        auto j = json::parse(body);
        if (!j.is_object()) {
            return std::unexpected("unexpected response: " + body);
        }

        if (j.contains("error")) {
            auto& err = j["error"];
            // OpenAI nests the message, whisper.cpp server sends a string
            std::string msg = err.is_object() ? err.value("message", err.dump())
                            : err.is_string() ? err.get<std::string>() : err.dump();
            return std::unexpected("server error: " + msg);
        }
        if (!j.contains("text")) {
            return std::unexpected("unexpected response: " + body);
        }

        Transcript t;
        t.text = transcript::trim(j["text"].get<std::string>());
        if (j.contains("language") && j["language"].is_string()) {
            t.language = j["language"].get<std::string>();
        }

        if (j.contains("segments") && j["segments"].is_array()) {
            for (auto& s : j["segments"]) {
                Segment seg;
                seg.start_s = s.value("start", 0.0);
                if (s.contains("end") && s["end"].is_number()) {
                    seg.end_s = s["end"].get<double>();
                }
                seg.text = transcript::trim(s.value("text", ""));
                t.segments.push_back(std::move(seg));
            }
        }

        return t;
    } catch (const json::exception& e) {
        return std::unexpected(std::string("JSON parse error: ") + e.what());
    }
}

void LanBackend::log(const std::string& msg) {
    if (verbose_) {
        std::println(stderr, "[whisperdesk] {}", msg);
    }
}
