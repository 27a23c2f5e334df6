#include "session.hpp"

#include <print>

std::string_view to_string(SessionState state) {
    switch (state) {
        case SessionState::Unloaded: return "unloaded";
        case SessionState::LoadingModel: return "loading";
        case SessionState::Ready: return "ready";
        case SessionState::Transcribing: return "transcribing";
    }
    return "unknown";
}

bool Session::begin_model_load(const std::string& model) {
    if (!can_change_model()) {
        std::println(stderr, "session: cannot load model while {}", to_string(state_));
        return false;
    }

    model_ = model;
    state_ = SessionState::LoadingModel;
    return true;
}

void Session::finish_model_load(bool ok) {
    if (state_ != SessionState::LoadingModel) return;

    if (ok) {
        state_ = SessionState::Ready;
    } else {
        model_.clear();
        state_ = SessionState::Unloaded;
    }
}

bool Session::begin_transcription(const std::string& file) {
    if (state_ != SessionState::Ready) {
        std::println(stderr, "session: cannot transcribe, state is {}", to_string(state_));
        return false;
    }

    file_ = file;
    state_ = SessionState::Transcribing;
    return true;
}

void Session::finish_transcription() {
    if (state_ == SessionState::Transcribing) {
        state_ = SessionState::Ready;
    }
}
