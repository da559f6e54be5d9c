#include "session_controller.h"
#include "audio_format.h"
#include "model_catalog.h"
#include "transcriber.h"

#include <glib.h>

#include <exception>
#include <utility>

namespace voiceclip {

static constexpr glong PREVIEW_CHARS = 60;

static std::string preview(const std::string &text) {
    if (g_utf8_strlen(text.c_str(), -1) <= PREVIEW_CHARS) return text;
    gchar *head = g_utf8_substring(text.c_str(), 0, PREVIEW_CHARS);
    std::string out = std::string(head) + "...";
    g_free(head);
    return out;
}

SessionController::SessionController(Platform &platform, AudioCapture &capture,
                                     TranscriptionBackend &backend,
                                     ModelSelection &models,
                                     ControllerSettings settings)
    : platform_(platform), capture_(capture), backend_(backend),
      models_(models), settings_(settings),
      max_samples_(static_cast<size_t>(settings.max_recording_seconds) *
                   SAMPLE_RATE) {}

SessionController::~SessionController() {
    if (state() == SessionState::Recording) {
        capture_.stop();
    }
    join_worker();
}

SessionState SessionController::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return session_.state;
}

size_t SessionController::buffered_samples() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return session_.sample_count();
}

SessionOutcome SessionController::last_outcome() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return last_outcome_;
}

void SessionController::wait_for_idle() { join_worker(); }

void SessionController::join_worker() {
    if (worker_.joinable() && worker_.get_id() != std::this_thread::get_id()) {
        worker_.join();
    }
}

// --- Hotkey events ---

void SessionController::on_hotkey_pressed() {
    SessionState current = state();
    if (current != SessionState::Idle) {
        g_debug("Hotkey pressed while %s, ignoring",
                session_state_name(current));
        return;
    }

    // The previous worker has already reached Idle
    join_worker();

    {
        std::lock_guard<std::mutex> lock(mutex_);
        session_ = Session{};
        session_.state = SessionState::Recording;
        session_.start_time = std::chrono::steady_clock::now();
        overflow_warned_ = false;
    }
    platform_.tray().set_session_state(SessionState::Recording);
    platform_.indicator().show("Listening...");

    GError *error = nullptr;
    bool started = capture_.start(
        [this](const float *samples, size_t count) {
            on_audio_block(samples, count);
        },
        [this](const std::string &message) { on_capture_failed(message); },
        &error);
    if (!started) {
        g_warning("Microphone error: %s", error->message);
        g_error_free(error);
        begin_device_error();
        return;
    }

    g_message("Recording...");
}

void SessionController::on_hotkey_released() {
    std::vector<float> samples;
    double held_seconds = 0.0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (session_.state != SessionState::Recording) {
            g_debug("Hotkey released while %s, ignoring",
                    session_state_name(session_.state));
            return;
        }
        session_.state = SessionState::Transcribing;
        samples = session_.flatten();
        session_.clear_audio();
        held_seconds = std::chrono::duration<double>(
                           std::chrono::steady_clock::now() - session_.start_time)
                           .count();
    }

    capture_.stop();
    platform_.tray().set_session_state(SessionState::Transcribing);
    platform_.indicator().update("Transcribing...", IndicatorState::Processing);

    g_message("Processing %.1fs of audio (held %.1fs)",
              samples_to_seconds(samples.size()), held_seconds);

    join_worker();
    worker_ = std::thread(&SessionController::run_transcription, this,
                          std::move(samples), models_.current_path());
}

// --- Audio events ---

void SessionController::on_audio_block(const float *samples, size_t count) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (session_.state != SessionState::Recording) return;

    if (session_.sample_count() + count > max_samples_) {
        if (!overflow_warned_) {
            g_warning("Recording limit of %ds reached, dropping further audio",
                      settings_.max_recording_seconds);
            overflow_warned_ = true;
        }
        return;
    }
    session_.append(samples, count);
}

void SessionController::on_capture_failed(const std::string &message) {
    if (state() != SessionState::Recording) return;

    g_warning("Audio stream failed: %s", message.c_str());
    capture_.stop();
    begin_device_error();
}

void SessionController::begin_device_error() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        session_.clear_audio();
    }
    set_state(SessionState::Displaying);
    join_worker();
    worker_ = std::thread(&SessionController::run_device_error, this);
}

// --- Worker ---

void SessionController::run_transcription(std::vector<float> samples,
                                          std::string model_path) {
    try {
        double duration = samples_to_seconds(samples.size());
        if (samples.empty() || duration < settings_.min_duration_seconds) {
            g_message("Too short (%.2fs), skipping", duration);
            finish(SessionOutcome::Skipped);
            return;
        }

        TranscriptionResult result = backend_.transcribe(samples, model_path);

        if (result.error) {
            g_warning("Transcription error: %s", result.error->c_str());
            show_result("Error", IndicatorState::Error, settings_.dwell);
            finish(SessionOutcome::Error);
            return;
        }

        if (result.text.empty()) {
            g_message("No speech detected");
            show_result("No speech", IndicatorState::Error, settings_.dwell);
            finish(SessionOutcome::NoSpeech);
            return;
        }

        platform_.clipboard().copy(result.text);
        g_message("Copied (%.1fs): %s", result.elapsed_seconds,
                  preview(result.text).c_str());
        show_result("Copied!", IndicatorState::Success, settings_.dwell);
        finish(SessionOutcome::Copied);
    } catch (const std::exception &e) {
        g_warning("Transcription task failed: %s", e.what());
        show_result("Error", IndicatorState::Error, settings_.dwell);
        finish(SessionOutcome::Error);
    }
}

void SessionController::run_device_error() {
    platform_.indicator().update("Microphone error", IndicatorState::Error);
    std::this_thread::sleep_for(settings_.error_dwell);
    finish(SessionOutcome::DeviceError);
}

void SessionController::show_result(const std::string &text,
                                    IndicatorState state,
                                    std::chrono::milliseconds dwell) {
    set_state(SessionState::Displaying);
    platform_.indicator().update(text, state);
    std::this_thread::sleep_for(dwell);
}

void SessionController::finish(SessionOutcome outcome) {
    // UI first, so a new session's updates are queued after these
    platform_.indicator().hide();
    platform_.tray().set_session_state(SessionState::Idle);

    std::lock_guard<std::mutex> lock(mutex_);
    last_outcome_ = outcome;
    session_ = Session{};
    g_debug("Session finished: %s", session_outcome_name(outcome));
}

void SessionController::set_state(SessionState state) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        session_.state = state;
    }
    platform_.tray().set_session_state(state);
}

} // namespace voiceclip
