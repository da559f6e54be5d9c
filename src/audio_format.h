#ifndef VOICECLIP_AUDIO_FORMAT_H
#define VOICECLIP_AUDIO_FORMAT_H

#include <glib.h>

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace voiceclip {

// whisper.cpp expects 16 kHz mono input
inline constexpr int SAMPLE_RATE = 16000;
inline constexpr int NUM_CHANNELS = 1;
inline constexpr int BITS_PER_SAMPLE = 16;

double samples_to_seconds(size_t num_samples);

// Scales [-1.0, 1.0] floats by 32767; out-of-range input is clamped.
std::vector<int16_t> float_to_pcm16(const std::vector<float> &samples);

bool write_wav_file(const std::string &path,
                    const std::vector<int16_t> &samples, GError **error);

} // namespace voiceclip

#endif
