#ifndef VOICECLIP_ENGINE_LOCATOR_H
#define VOICECLIP_ENGINE_LOCATOR_H

#include <glib.h>

#include <string>

namespace voiceclip {

struct Config;

inline constexpr const char *ENGINE_NAME = "whisper-cli";
inline constexpr const char *SETUP_HINT =
    "Run ./setup.sh to install whisper.cpp and download models.";

struct EngineLocation {
    std::string engine_path;
    std::string models_dir;
};

// Directory holding the running executable, or the working directory
std::string executable_dir();

// Resolves whisper-cli and its models directory. Failures are setup errors.
bool locate_engine(const Config &config, const std::string &base_dir,
                   EngineLocation *location, GError **error);

} // namespace voiceclip

#endif
