#ifndef VOICECLIP_ERROR_H
#define VOICECLIP_ERROR_H

#include <glib.h>

#define VOICECLIP_ERROR (voiceclip_error_quark())

G_BEGIN_DECLS
GQuark voiceclip_error_quark(void);
G_END_DECLS

namespace voiceclip {

enum ErrorCode {
    ERROR_ENGINE_NOT_FOUND,
    ERROR_MODELS_NOT_FOUND,
    ERROR_MODEL_NOT_DOWNLOADED,
    ERROR_UNKNOWN_MODEL,
    ERROR_AUDIO_DEVICE,
    ERROR_WAV_WRITE,
    ERROR_CONFIG,
    ERROR_HOTKEY,
};

} // namespace voiceclip

#endif
