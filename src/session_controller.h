#ifndef VOICECLIP_SESSION_CONTROLLER_H
#define VOICECLIP_SESSION_CONTROLLER_H

#include "audio_capture.h"
#include "platform.h"
#include "session.h"

#include <chrono>
#include <cstddef>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace voiceclip {

class ModelSelection;
class TranscriptionBackend;

struct ControllerSettings {
    double min_duration_seconds = 0.3;
    std::chrono::milliseconds dwell{1000};
    std::chrono::milliseconds error_dwell{2000};
    int max_recording_seconds = 300;
};

// Push-to-talk state machine: Idle -> Recording -> Transcribing ->
// Displaying -> Idle. Hotkey and audio events arrive on the main loop; the
// engine call and the result dwell run on one worker thread per session.
class SessionController {
public:
    SessionController(Platform &platform, AudioCapture &capture,
                      TranscriptionBackend &backend, ModelSelection &models,
                      ControllerSettings settings);
    ~SessionController();

    SessionController(const SessionController &) = delete;
    SessionController &operator=(const SessionController &) = delete;

    void on_hotkey_pressed();
    void on_hotkey_released();

    SessionState state() const;
    size_t buffered_samples() const;
    SessionOutcome last_outcome() const;

    // Blocks until the current session's worker has finished
    void wait_for_idle();

private:
    void on_audio_block(const float *samples, size_t count);
    void on_capture_failed(const std::string &message);

    void begin_device_error();
    void run_transcription(std::vector<float> samples, std::string model_path);
    void run_device_error();

    void show_result(const std::string &text, IndicatorState state,
                     std::chrono::milliseconds dwell);
    void finish(SessionOutcome outcome);
    void set_state(SessionState state);
    void join_worker();

    Platform &platform_;
    AudioCapture &capture_;
    TranscriptionBackend &backend_;
    ModelSelection &models_;
    ControllerSettings settings_;
    size_t max_samples_;

    mutable std::mutex mutex_;
    Session session_;
    SessionOutcome last_outcome_ = SessionOutcome::None;
    bool overflow_warned_ = false;

    std::thread worker_;
};

} // namespace voiceclip

#endif
