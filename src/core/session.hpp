#pragma once

#include <string>
#include <string_view>

enum class SessionState { Unloaded, LoadingModel, Ready, Transcribing };

std::string_view to_string(SessionState state);

// Tracks what the front end may do next: files can be transcribed only with
// a model loaded, and the model can change only while nothing is running.
class Session {
public:
    bool begin_model_load(const std::string& model);
    void finish_model_load(bool ok);

    bool begin_transcription(const std::string& file);
    void finish_transcription();

    SessionState state() const { return state_; }
    bool can_select_file() const { return state_ == SessionState::Ready; }
    bool can_change_model() const {
        return state_ == SessionState::Unloaded || state_ == SessionState::Ready;
    }
    bool busy() const {
        return state_ == SessionState::LoadingModel || state_ == SessionState::Transcribing;
    }

    // Model that is loaded, or being loaded.
    const std::string& model() const { return model_; }
    // File of the current or most recent transcription.
    const std::string& file() const { return file_; }

private:
    SessionState state_ = SessionState::Unloaded;
    std::string model_;
    std::string file_;
};
