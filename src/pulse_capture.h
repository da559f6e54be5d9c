#ifndef VOICECLIP_PULSE_CAPTURE_H
#define VOICECLIP_PULSE_CAPTURE_H

#include "audio_capture.h"

#include <pulse/glib-mainloop.h>
#include <pulse/pulseaudio.h>

#include <string>

namespace voiceclip {

// Microphone capture on the default GLib main context
class PulseCapture : public AudioCapture {
public:
    explicit PulseCapture(std::string device);
    ~PulseCapture() override;

    PulseCapture(const PulseCapture &) = delete;
    PulseCapture &operator=(const PulseCapture &) = delete;

    // Starts connecting to the sound server; readiness is asynchronous
    void connect();

    bool start(BlockCallback on_block, FailureCallback on_failure,
               GError **error) override;
    void stop() override;

    bool is_ready() const { return ready_; }

private:
    static void on_context_state(pa_context *c, void *userdata);
    static void on_stream_read(pa_stream *s, size_t nbytes, void *userdata);
    static void on_stream_state(pa_stream *s, void *userdata);

    std::string device_;
    pa_glib_mainloop *mainloop_ = nullptr;
    pa_context *context_ = nullptr;
    pa_stream *stream_ = nullptr;
    bool ready_ = false;

    BlockCallback on_block_;
    FailureCallback on_failure_;
};

} // namespace voiceclip

#endif
