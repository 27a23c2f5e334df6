#pragma once

#include "session.hpp"
#include "storage/history_db.hpp"
#include "transcriber.hpp"

#include <atomic>
#include <cstdint>
#include <expected>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <thread>

// Front-end logic shared by the GUI: runs model loads and transcriptions on a
// worker thread and turns their outcome into session state and status text.
// Everything except the callbacks runs on the caller's (UI) thread.
class AppCore {
public:
    struct Progress {
        enum class Kind { Download, Inference } kind;
        int percent = -1; // -1 while the total is unknown
        uint64_t bytes = 0;
        uint64_t total = 0;
    };

    // Both are invoked on the worker thread.
    using NotifyCallback = std::function<void()>;
    using ProgressCallback = std::function<void(const Progress&)>;

    AppCore(std::unique_ptr<Transcriber> transcriber, HistoryDb* history,
            NotifyCallback notify, ProgressCallback progress, bool verbose = false);
    ~AppCore();

    AppCore(const AppCore&) = delete;
    AppCore& operator=(const AppCore&) = delete;

    // Returns false when the request was rejected; status() says why.
    bool select_model(const std::string& name);
    bool transcribe_file(const std::string& path);

    // Applies the finished worker's result. Call after NotifyCallback fired.
    // Returns true when a new transcript became available.
    bool on_worker_complete();

    void cancel();
    void shutdown();

    const Session& session() const { return session_; }
    SessionState state() const { return session_.state(); }
    const std::string& status() const { return status_; }
    const std::optional<Transcript>& last_transcript() const { return last_transcript_; }
    const std::string& last_file() const { return last_file_; }

private:
    enum class Job { None, LoadModel, Transcribe };

    void start_worker(Job job, std::string arg);
    void log(const std::string& msg);

    std::unique_ptr<Transcriber> transcriber_;
    HistoryDb* history_;
    NotifyCallback notify_;
    ProgressCallback progress_;
    bool verbose_;

    Session session_;
    std::string status_;
    std::optional<Transcript> last_transcript_;
    std::string last_file_;
    bool initialized_ = false;
    std::atomic<bool> cancel_download_{false};

    struct WorkerResult {
        Job job = Job::None;
        std::string arg;
        std::expected<ModelHandle, std::string> model;
        std::expected<Transcript, std::string> transcript;
    };
    WorkerResult worker_result_;
    std::jthread worker_;
};
