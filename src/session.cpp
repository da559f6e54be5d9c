#include "session.h"

namespace voiceclip {

const char *session_state_name(SessionState state) {
    switch (state) {
    case SessionState::Idle:
        return "Ready";
    case SessionState::Recording:
        return "Recording...";
    case SessionState::Transcribing:
        return "Transcribing...";
    case SessionState::Displaying:
        return "Done";
    }
    return "Unknown";
}

const char *session_outcome_name(SessionOutcome outcome) {
    switch (outcome) {
    case SessionOutcome::None:
        return "none";
    case SessionOutcome::Skipped:
        return "skipped";
    case SessionOutcome::Copied:
        return "copied";
    case SessionOutcome::NoSpeech:
        return "no speech";
    case SessionOutcome::Error:
        return "error";
    case SessionOutcome::DeviceError:
        return "device error";
    }
    return "unknown";
}

void Session::append(const float *samples, size_t count) {
    audio_buffer_.emplace_back(samples, samples + count);
    num_samples_ += count;
}

void Session::clear_audio() {
    audio_buffer_.clear();
    num_samples_ = 0;
}

std::vector<float> Session::flatten() const {
    std::vector<float> samples;
    samples.reserve(num_samples_);
    for (const auto &block : audio_buffer_) {
        samples.insert(samples.end(), block.begin(), block.end());
    }
    return samples;
}

} // namespace voiceclip
