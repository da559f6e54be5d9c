#include "audio_format.h"
#include "error.h"

#include <algorithm>
#include <fstream>

namespace voiceclip {

double samples_to_seconds(size_t num_samples) {
    return static_cast<double>(num_samples) / static_cast<double>(SAMPLE_RATE);
}

std::vector<int16_t> float_to_pcm16(const std::vector<float> &samples) {
    std::vector<int16_t> out;
    out.reserve(samples.size());
    for (float s : samples) {
        float clamped = std::clamp(s, -1.0f, 1.0f);
        out.push_back(static_cast<int16_t>(clamped * 32767.0f));
    }
    return out;
}

bool write_wav_file(const std::string &path,
                    const std::vector<int16_t> &samples, GError **error) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out) {
        g_set_error(error, VOICECLIP_ERROR, ERROR_WAV_WRITE,
                    "Cannot open '%s' for writing", path.c_str());
        return false;
    }

    uint32_t data_size = static_cast<uint32_t>(samples.size() * sizeof(int16_t));
    uint32_t file_size = 36 + data_size;
    uint16_t block_align = NUM_CHANNELS * BITS_PER_SAMPLE / 8;
    uint32_t byte_rate = SAMPLE_RATE * block_align;

    // RIFF header
    out.write("RIFF", 4);
    out.write(reinterpret_cast<const char *>(&file_size), 4);
    out.write("WAVE", 4);

    // fmt chunk
    out.write("fmt ", 4);
    uint32_t fmt_size = 16;
    out.write(reinterpret_cast<const char *>(&fmt_size), 4);
    uint16_t audio_format = 1; // PCM
    out.write(reinterpret_cast<const char *>(&audio_format), 2);
    uint16_t channels = NUM_CHANNELS;
    out.write(reinterpret_cast<const char *>(&channels), 2);
    uint32_t sample_rate = SAMPLE_RATE;
    out.write(reinterpret_cast<const char *>(&sample_rate), 4);
    out.write(reinterpret_cast<const char *>(&byte_rate), 4);
    out.write(reinterpret_cast<const char *>(&block_align), 2);
    uint16_t bits = BITS_PER_SAMPLE;
    out.write(reinterpret_cast<const char *>(&bits), 2);

    // data chunk
    out.write("data", 4);
    out.write(reinterpret_cast<const char *>(&data_size), 4);
    out.write(reinterpret_cast<const char *>(samples.data()),
              static_cast<std::streamsize>(data_size));

    out.flush();
    if (!out.good()) {
        g_set_error(error, VOICECLIP_ERROR, ERROR_WAV_WRITE,
                    "Failed writing %u bytes of audio to '%s'", data_size,
                    path.c_str());
        return false;
    }
    return true;
}

} // namespace voiceclip
