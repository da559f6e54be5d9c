#ifndef VOICECLIP_SESSION_H
#define VOICECLIP_SESSION_H

#include <chrono>
#include <cstddef>
#include <vector>

namespace voiceclip {

enum class SessionState { Idle, Recording, Transcribing, Displaying };

enum class SessionOutcome {
    None,
    Skipped,     // empty or too short, engine never ran
    Copied,
    NoSpeech,
    Error,       // engine failure or timeout
    DeviceError, // microphone unavailable
};

const char *session_state_name(SessionState state);
const char *session_outcome_name(SessionOutcome outcome);

// One press/release cycle. Owned by the SessionController.
struct Session {
    SessionState state = SessionState::Idle;
    std::chrono::steady_clock::time_point start_time;

    void append(const float *samples, size_t count);
    void clear_audio();

    size_t sample_count() const { return num_samples_; }
    size_t block_count() const { return audio_buffer_.size(); }
    std::vector<float> flatten() const;

private:
    std::vector<std::vector<float>> audio_buffer_;
    size_t num_samples_ = 0;
};

} // namespace voiceclip

#endif
