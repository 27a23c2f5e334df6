#include "app_core.hpp"

#include <filesystem>
#include <format>
#include <print>

namespace fs = std::filesystem;

AppCore::AppCore(std::unique_ptr<Transcriber> transcriber, HistoryDb* history,
                 NotifyCallback notify, ProgressCallback progress, bool verbose)
    : transcriber_(std::move(transcriber)), history_(history),
      notify_(std::move(notify)), progress_(std::move(progress)),
      verbose_(verbose) {}

AppCore::~AppCore() {
    shutdown();
}

bool AppCore::select_model(const std::string& name) {
    if (session_.state() == SessionState::Ready && session_.model() == name) {
        return true;
    }
    if (!session_.begin_model_load(name)) {
        return false;
    }

    if (!initialized_) {
        status_ = "Initializing Whisper model...";
    } else if (transcriber_->model_available(name)) {
        status_ = std::format("Loading {} model...", name);
    } else {
        status_ = std::format("Downloading {} model... This may take a few minutes...", name);
    }
    initialized_ = true;

    log("Selecting model " + name);
    start_worker(Job::LoadModel, name);
    return true;
}

bool AppCore::transcribe_file(const std::string& path) {
    std::error_code ec;
    if (!fs::exists(path, ec)) {
        status_ = "Error: File not found";
        return false;
    }
    if (!session_.begin_transcription(path)) {
        return false;
    }

    status_ = std::format("Transcribing {}...", fs::path(path).filename().string());
    start_worker(Job::Transcribe, path);
    return true;
}

void AppCore::start_worker(Job job, std::string arg) {
    if (worker_.joinable()) {
        worker_.join();
    }
    worker_result_ = {};
    cancel_download_.store(false, std::memory_order_relaxed);
    if (job == Job::Transcribe) {
        // Before the thread starts, so a Cancel pressed during decoding sticks
        transcriber_->reset_cancel();
    }

    worker_ = std::jthread([this, job, arg = std::move(arg)](std::stop_token) {
        WorkerResult result{.job = job, .arg = arg};

        if (job == Job::LoadModel) {
            result.model = transcriber_->load_model(arg, [this](uint64_t now, uint64_t total) {
                if (progress_) {
                    int pct = total > 0 ? static_cast<int>(now * 100 / total) : -1;
                    progress_(Progress{.kind = Progress::Kind::Download, .percent = pct,
                                       .bytes = now, .total = total});
                }
                return !cancel_download_.load(std::memory_order_relaxed);
            });
        } else {
            result.transcript = transcriber_->transcribe_file(arg, [this](int percent) {
                if (progress_) {
                    progress_(Progress{.kind = Progress::Kind::Inference, .percent = percent});
                }
            });
        }

        worker_result_ = std::move(result);
        notify_();
    });
}

bool AppCore::on_worker_complete() {
    if (worker_.joinable()) {
        worker_.join();
    }

    auto& wr = worker_result_;
    bool new_transcript = false;
    switch (wr.job) {
        case Job::None:
            return false;

        case Job::LoadModel:
            if (wr.model) {
                log(std::format("Model {} ready ({})", wr.arg,
                                wr.model->path.empty() ? transcriber_->backend_name() : wr.model->path));
                session_.finish_model_load(true);
                status_ = "Ready";
            } else {
                log("Model load failed: " + wr.model.error());
                session_.finish_model_load(false);
                status_ = "Error initializing: " + wr.model.error();
            }
            break;

        case Job::Transcribe:
            session_.finish_transcription();
            if (wr.transcript) {
                last_transcript_ = *wr.transcript;
                last_file_ = session_.file();
                if (history_ && history_->is_open() &&
                    !history_->insert(last_file_, transcriber_->current_model(),
                                      transcriber_->backend_name(), *wr.transcript)) {
                    log("History insert failed");
                }
                status_ = "Transcription complete";
                new_transcript = true;
            } else {
                log("Transcription failed: " + wr.transcript.error());
                status_ = "Error: " + wr.transcript.error();
            }
            break;
    }

    wr.job = Job::None;
    return new_transcript;
}

void AppCore::cancel() {
    if (session_.state() == SessionState::LoadingModel) {
        cancel_download_.store(true, std::memory_order_relaxed);
    } else if (session_.state() == SessionState::Transcribing) {
        transcriber_->cancel();
    }
}

void AppCore::shutdown() {
    if (session_.busy()) {
        log("Cancelling pending work...");
        cancel();
    }
    if (worker_.joinable()) {
        worker_.join();
    }
}

void AppCore::log(const std::string& msg) {
    if (verbose_) {
        std::println(stderr, "[whisperdesk] {}", msg);
    }
}
