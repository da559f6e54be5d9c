#ifndef VOICECLIP_TRANSCRIBER_H
#define VOICECLIP_TRANSCRIBER_H

#include <optional>
#include <string>
#include <vector>

namespace voiceclip {

struct TranscriptionResult {
    std::string text;
    double duration_seconds = 0.0;
    double elapsed_seconds = 0.0;
    std::optional<std::string> error;
};

class TranscriptionBackend {
public:
    virtual ~TranscriptionBackend() = default;

    // Blocking. Implementations report every failure through
    // TranscriptionResult::error instead of throwing.
    virtual TranscriptionResult transcribe(const std::vector<float> &samples,
                                           const std::string &model_path) = 0;
};

// Runs whisper.cpp's command line tool on a temporary WAV file.
class WhisperCliTranscriber : public TranscriptionBackend {
public:
    WhisperCliTranscriber(std::string engine_path, int timeout_seconds);

    TranscriptionResult transcribe(const std::vector<float> &samples,
                                   const std::string &model_path) override;

private:
    TranscriptionResult run(const std::vector<float> &samples,
                            const std::string &model_path);

    std::string engine_path_;
    int timeout_seconds_;
};

// Collapses runs of Unicode whitespace to single spaces and trims both ends.
std::string normalize_whitespace(const std::string &raw);

} // namespace voiceclip

#endif
