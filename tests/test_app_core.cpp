#include <catch2/catch_test_macros.hpp>

#include "app_core.hpp"
#include "audio/wav_encoder.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace fs = std::filesystem;
using namespace std::chrono_literals;

namespace {

// RAII temp directory that auto-deletes.
struct TmpDir {
    fs::path path;

    TmpDir() {
        std::string tmpl = (fs::temp_directory_path() / "wd_test_core_XXXXXX").string();
        std::vector<char> buf(tmpl.begin(), tmpl.end());
        buf.push_back('\0');
        path = mkdtemp(buf.data());
    }

    ~TmpDir() {
        std::error_code ec;
        fs::remove_all(path, ec);
    }
};

// Counts worker completions so the test thread can wait for them.
struct Notifier {
    std::mutex mu;
    std::condition_variable cv;
    int count = 0;

    void notify() {
        std::lock_guard lock(mu);
        ++count;
        cv.notify_all();
    }

    bool wait_for(int n) {
        std::unique_lock lock(mu);
        return cv.wait_for(lock, 10s, [&] { return count >= n; });
    }
};

class FakeFetcher : public ModelFetcher {
public:
    std::expected<FetchInfo, std::string>
    fetch(const std::string& /*url*/, const fs::path& dest, const FetchProgress& progress) override {
        ++calls;
        std::ofstream(dest, std::ios::binary) << "weights";
        if (stall) {
            // Keep reporting progress until the caller cancels
            for (int i = 0; i < 10000; ++i) {
                if (progress && !progress(1, 100)) return std::unexpected("download cancelled");
                std::this_thread::sleep_for(1ms);
            }
            return std::unexpected("fetch never cancelled");
        }
        if (progress) progress(7, 7);
        return FetchInfo{.etag = "", .commit = "", .bytes = 7};
    }

    bool stall = false;
    int calls = 0;
};

class FakeBackend : public InferenceBackend {
public:
    std::string name() const override { return "fake"; }

    std::expected<void, std::string> load_model(const ModelHandle& model) override {
        if (!load_error.empty()) return std::unexpected(load_error);
        loaded_path = model.path;
        return {};
    }

    std::expected<Transcript, std::string>
    transcribe(std::span<const float> pcm, uint32_t sample_rate,
               const TranscribeOptions& /*opts*/, const InferenceProgress& progress) override {
        ++calls;
        // Stands in for decoding time before the engine starts
        for (int i = 0; i < 10000 && hold; ++i) std::this_thread::sleep_for(1ms);
        if (cancelled) return std::unexpected("transcription cancelled");
        if (block) {
            for (int i = 0; i < 10000 && !cancelled; ++i) std::this_thread::sleep_for(1ms);
            return std::unexpected("transcription cancelled");
        }
        if (!transcribe_error.empty()) return std::unexpected(transcribe_error);
        if (progress) progress(100);

        Transcript t;
        t.text = "hello world";
        t.language = "en";
        t.audio_duration_s = static_cast<double>(pcm.size()) / sample_rate;
        t.segments = {Segment{.start_s = 0.0, .end_s = t.audio_duration_s, .text = "hello world"}};
        return t;
    }

    void cancel() override { cancelled = true; }
    void reset_cancel() override { cancelled = false; }

    std::string load_error;
    std::string transcribe_error;
    std::string loaded_path;
    bool block = false;
    std::atomic<bool> hold{false};
    std::atomic<bool> cancelled{false};
    int calls = 0;
};

struct Fixture {
    TmpDir tmp;
    Notifier notifier;
    HistoryDb history;
    FakeBackend* backend = nullptr;
    FakeFetcher* fetcher = nullptr;
    std::mutex progress_mu;
    std::vector<AppCore::Progress> progress;
    std::unique_ptr<AppCore> core;

    Fixture() {
        Config config;
        config.model.dir = (tmp.path / "models").string();
        config.history.enabled = true;

        auto b = std::make_unique<FakeBackend>();
        auto f = std::make_unique<FakeFetcher>();
        backend = b.get();
        fetcher = f.get();

        REQUIRE(history.open((tmp.path / "history.db").string()));

        core = std::make_unique<AppCore>(
            std::make_unique<Transcriber>(config, std::move(b), std::move(f)), &history,
            [this]() { notifier.notify(); },
            [this](const AppCore::Progress& p) {
                std::lock_guard lock(progress_mu);
                progress.push_back(p);
            });
    }

    // Runs one worker job to completion on the calling thread.
    bool complete(int job_number) {
        REQUIRE(notifier.wait_for(job_number));
        return core->on_worker_complete();
    }

    std::string write_clip(const std::string& name) {
        std::vector<float> samples(16000, 0.1f);
        auto bytes = wav::encode(samples, 16000);
        auto p = tmp.path / name;
        std::ofstream f(p, std::ios::binary);
        f.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
        return p.string();
    }
};

} // namespace

TEST_CASE("AppCore model loading", "[core]") {
    Fixture fx;

    SECTION("InitialLoadDownloads") {
        REQUIRE(fx.core->select_model("tiny"));
        REQUIRE(fx.core->status() == "Initializing Whisper model...");
        REQUIRE(fx.core->state() == SessionState::LoadingModel);

        REQUIRE_FALSE(fx.complete(1));
        REQUIRE(fx.core->state() == SessionState::Ready);
        REQUIRE(fx.core->status() == "Ready");
        REQUIRE(fx.core->session().model() == "tiny");
        REQUIRE(fx.fetcher->calls == 1);
        REQUIRE(fx.backend->loaded_path.ends_with("ggml-tiny.bin"));

        std::lock_guard lock(fx.progress_mu);
        REQUIRE_FALSE(fx.progress.empty());
        REQUIRE(fx.progress.back().kind == AppCore::Progress::Kind::Download);
        REQUIRE(fx.progress.back().percent == 100);
    }

    SECTION("StatusNamesDownloadOrLoad") {
        REQUIRE(fx.core->select_model("tiny"));
        fx.complete(1);

        REQUIRE(fx.core->select_model("base"));
        REQUIRE(fx.core->status() == "Downloading base model... This may take a few minutes...");
        fx.complete(2);

        REQUIRE(fx.core->select_model("tiny"));
        REQUIRE(fx.core->status() == "Loading tiny model...");
        fx.complete(3);
        REQUIRE(fx.core->session().model() == "tiny");
        REQUIRE(fx.fetcher->calls == 2);
    }

    SECTION("SameModelIsNoop") {
        REQUIRE(fx.core->select_model("tiny"));
        fx.complete(1);

        REQUIRE(fx.core->select_model("tiny"));
        REQUIRE(fx.core->state() == SessionState::Ready);
        REQUIRE(fx.core->status() == "Ready");
    }

    SECTION("LoadFailure") {
        fx.backend->load_error = "failed to load model from x";
        REQUIRE(fx.core->select_model("tiny"));
        fx.complete(1);

        REQUIRE(fx.core->state() == SessionState::Unloaded);
        REQUIRE(fx.core->status() == "Error initializing: failed to load model from x");
        REQUIRE(fx.core->session().model().empty());
    }

    SECTION("CancelDownload") {
        fx.fetcher->stall = true;
        REQUIRE(fx.core->select_model("medium"));
        REQUIRE_FALSE(fx.core->select_model("small"));
        fx.core->cancel();
        fx.complete(1);

        REQUIRE(fx.core->state() == SessionState::Unloaded);
        REQUIRE(fx.core->status() == "Error initializing: download cancelled");
    }
}

TEST_CASE("AppCore transcription", "[core]") {
    Fixture fx;
    REQUIRE(fx.core->select_model("tiny"));
    fx.complete(1);
    REQUIRE(fx.core->state() == SessionState::Ready);

    SECTION("MissingFile") {
        REQUIRE_FALSE(fx.core->transcribe_file((fx.tmp.path / "gone.mp3").string()));
        REQUIRE(fx.core->status() == "Error: File not found");
        REQUIRE(fx.core->state() == SessionState::Ready);
    }

    SECTION("Success") {
        auto clip = fx.write_clip("clip.wav");
        REQUIRE(fx.core->transcribe_file(clip));
        REQUIRE(fx.core->status() == "Transcribing clip.wav...");
        REQUIRE(fx.core->state() == SessionState::Transcribing);

        REQUIRE(fx.complete(2));
        REQUIRE(fx.core->state() == SessionState::Ready);
        REQUIRE(fx.core->status() == "Transcription complete");
        REQUIRE(fx.core->last_file() == clip);
        REQUIRE(fx.core->last_transcript().has_value());
        REQUIRE(fx.core->last_transcript()->text == "hello world");
        REQUIRE(fx.core->last_transcript()->audio_duration_s == 1.0);

        auto entries = fx.history.recent(1);
        REQUIRE(entries.size() == 1);
        REQUIRE(entries[0].file_path == clip);
        REQUIRE(entries[0].model == "tiny");
        REQUIRE(entries[0].backend == "fake");
    }

    SECTION("Failure") {
        fx.backend->transcribe_error = "whisper_full failed (code -1)";
        REQUIRE(fx.core->transcribe_file(fx.write_clip("clip.wav")));

        REQUIRE_FALSE(fx.complete(2));
        REQUIRE(fx.core->state() == SessionState::Ready);
        REQUIRE(fx.core->status() == "Error: whisper_full failed (code -1)");
        REQUIRE_FALSE(fx.core->last_transcript().has_value());
        REQUIRE(fx.history.recent(1).empty());
    }

    SECTION("ModelLockedWhileTranscribing") {
        fx.backend->block = true;
        REQUIRE(fx.core->transcribe_file(fx.write_clip("clip.wav")));
        REQUIRE_FALSE(fx.core->select_model("base"));
        REQUIRE_FALSE(fx.core->transcribe_file(fx.write_clip("other.wav")));
        REQUIRE(fx.core->session().model() == "tiny");

        fx.core->cancel();
        fx.complete(2);
        REQUIRE(fx.core->state() == SessionState::Ready);
        REQUIRE(fx.core->status() == "Error: transcription cancelled");
    }

    SECTION("CancelBeforeInference") {
        fx.backend->hold = true;
        REQUIRE(fx.core->transcribe_file(fx.write_clip("clip.wav")));
        fx.core->cancel();
        fx.backend->hold = false;

        REQUIRE_FALSE(fx.complete(2));
        REQUIRE(fx.core->status() == "Error: transcription cancelled");
        REQUIRE_FALSE(fx.core->last_transcript().has_value());
    }

    SECTION("CancelDoesNotCarryOver") {
        fx.backend->block = true;
        REQUIRE(fx.core->transcribe_file(fx.write_clip("clip.wav")));
        fx.core->cancel();
        fx.complete(2);
        REQUIRE(fx.core->status() == "Error: transcription cancelled");

        fx.backend->block = false;
        REQUIRE(fx.core->transcribe_file(fx.write_clip("clip.wav")));
        REQUIRE(fx.complete(3));
        REQUIRE(fx.core->status() == "Transcription complete");
        REQUIRE(fx.backend->calls == 2);
    }
}
