#ifndef VOICECLIP_AUDIO_CAPTURE_H
#define VOICECLIP_AUDIO_CAPTURE_H

#include <glib.h>

#include <cstddef>
#include <functional>
#include <string>

namespace voiceclip {

// 16 kHz mono float microphone input
class AudioCapture {
public:
    using BlockCallback = std::function<void(const float *samples, size_t count)>;
    using FailureCallback = std::function<void(const std::string &message)>;

    virtual ~AudioCapture() = default;

    virtual bool start(BlockCallback on_block, FailureCallback on_failure,
                       GError **error) = 0;
    virtual void stop() = 0;
};

} // namespace voiceclip

#endif
