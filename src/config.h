#ifndef VOICECLIP_CONFIG_H
#define VOICECLIP_CONFIG_H

#include <glib.h>

#include <string>
#include <vector>

namespace voiceclip {

inline constexpr int MAX_TIMEOUT_SECONDS = 24 * 60 * 60;

struct Config {
    // [engine]
    std::string engine_path;
    std::string models_dir;
    int timeout_seconds = 120;

    // [session]
    std::string default_model = "Base (Fast)";
    double min_duration_seconds = 0.3;
    int dwell_ms = 1000;
    int error_dwell_ms = 2000;
    int max_recording_seconds = 300;

    // [hotkey] X keysym names, all held to record
    std::vector<std::string> hotkey_keys = {"Control_L", "Alt_L"};

    // [audio] PulseAudio source, empty = default
    std::string audio_device;
};

std::string default_config_path();

// A missing file is not an error unless |required| is set.
bool load_config_file(const std::string &path, bool required, Config *config,
                      GError **error);

// VOICECLIP_ENGINE / VOICECLIP_MODELS_DIR override the key file
void apply_environment(Config *config);

bool validate_config(const Config &config, GError **error);

std::string describe_key(const std::string &keysym);
std::string describe_hotkey(const std::vector<std::string> &keys);

} // namespace voiceclip

#endif
