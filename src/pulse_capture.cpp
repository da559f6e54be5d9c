#include "pulse_capture.h"
#include "audio_format.h"
#include "error.h"

#include <utility>

namespace voiceclip {

PulseCapture::PulseCapture(std::string device) : device_(std::move(device)) {}

PulseCapture::~PulseCapture() {
    stop();
    if (context_ != nullptr) {
        pa_context_disconnect(context_);
        pa_context_unref(context_);
        context_ = nullptr;
    }
    if (mainloop_ != nullptr) {
        pa_glib_mainloop_free(mainloop_);
        mainloop_ = nullptr;
    }
}

void PulseCapture::connect() {
    if (context_ != nullptr) return;

    mainloop_ = pa_glib_mainloop_new(g_main_context_default());
    pa_mainloop_api *api = pa_glib_mainloop_get_api(mainloop_);
    context_ = pa_context_new(api, "voiceclip");
    pa_context_set_state_callback(context_, on_context_state, this);
    if (pa_context_connect(context_, nullptr, PA_CONTEXT_NOFLAGS, nullptr) < 0) {
        g_warning("PulseAudio connect failed: %s",
                  pa_strerror(pa_context_errno(context_)));
    }
}

void PulseCapture::on_context_state(pa_context *c, void *userdata) {
    auto *self = static_cast<PulseCapture *>(userdata);

    switch (pa_context_get_state(c)) {
    case PA_CONTEXT_READY:
        self->ready_ = true;
        g_debug("PulseAudio ready");
        break;
    case PA_CONTEXT_FAILED:
    case PA_CONTEXT_TERMINATED:
        self->ready_ = false;
        g_warning("PulseAudio context failed: %s",
                  pa_strerror(pa_context_errno(c)));
        break;
    default:
        break;
    }
}

bool PulseCapture::start(BlockCallback on_block, FailureCallback on_failure,
                         GError **error) {
    if (!ready_) {
        g_set_error_literal(error, VOICECLIP_ERROR, ERROR_AUDIO_DEVICE,
                            "Audio server unavailable");
        return false;
    }
    if (stream_ != nullptr) stop();

    static const pa_sample_spec spec = {
        .format = PA_SAMPLE_FLOAT32LE,
        .rate = SAMPLE_RATE,
        .channels = NUM_CHANNELS,
    };

    stream_ = pa_stream_new(context_, "voiceclip-record", &spec, nullptr);
    if (stream_ == nullptr) {
        g_set_error(error, VOICECLIP_ERROR, ERROR_AUDIO_DEVICE,
                    "Failed to create stream: %s",
                    pa_strerror(pa_context_errno(context_)));
        return false;
    }

    on_block_ = std::move(on_block);
    on_failure_ = std::move(on_failure);
    pa_stream_set_read_callback(stream_, on_stream_read, this);
    pa_stream_set_state_callback(stream_, on_stream_state, this);

    pa_buffer_attr attr = {};
    attr.maxlength = static_cast<uint32_t>(-1);
    attr.tlength = static_cast<uint32_t>(-1);
    attr.prebuf = static_cast<uint32_t>(-1);
    attr.minreq = static_cast<uint32_t>(-1);
    attr.fragsize = 800 * sizeof(float); // ~50ms at 16 kHz mono float

    const char *dev = device_.empty() ? nullptr : device_.c_str();
    if (pa_stream_connect_record(stream_, dev, &attr,
                                 PA_STREAM_ADJUST_LATENCY) < 0) {
        g_set_error(error, VOICECLIP_ERROR, ERROR_AUDIO_DEVICE,
                    "Failed to connect stream: %s",
                    pa_strerror(pa_context_errno(context_)));
        pa_stream_unref(stream_);
        stream_ = nullptr;
        return false;
    }
    return true;
}

void PulseCapture::stop() {
    if (stream_ != nullptr) {
        pa_stream_set_read_callback(stream_, nullptr, nullptr);
        pa_stream_set_state_callback(stream_, nullptr, nullptr);
        pa_stream_disconnect(stream_);
        pa_stream_unref(stream_);
        stream_ = nullptr;
    }
    on_block_ = nullptr;
    on_failure_ = nullptr;
}

void PulseCapture::on_stream_read(pa_stream *s, size_t /*nbytes*/,
                                  void *userdata) {
    auto *self = static_cast<PulseCapture *>(userdata);

    const void *data;
    size_t length;

    while (pa_stream_peek(s, &data, &length) >= 0 && length > 0) {
        if (data != nullptr && self->on_block_) {
            auto num_samples = length / sizeof(float);
            self->on_block_(static_cast<const float *>(data), num_samples);
        }
        pa_stream_drop(s);
    }
}

void PulseCapture::on_stream_state(pa_stream *s, void *userdata) {
    auto *self = static_cast<PulseCapture *>(userdata);

    if (pa_stream_get_state(s) == PA_STREAM_FAILED) {
        std::string message = pa_strerror(pa_context_errno(self->context_));
        // The handler may stop (and free) this stream
        FailureCallback on_failure = self->on_failure_;
        if (on_failure) on_failure(message);
    }
}

} // namespace voiceclip
