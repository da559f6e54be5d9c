#include "error.h"

G_DEFINE_QUARK(voiceclip-error-quark, voiceclip_error)
