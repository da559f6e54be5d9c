#include "engine_locator.h"
#include "config.h"
#include "error.h"

#include <filesystem>
#include <vector>

namespace fs = std::filesystem;

namespace voiceclip {

std::string executable_dir() {
    std::error_code ec;
    fs::path self = fs::read_symlink("/proc/self/exe", ec);
    if (ec) return fs::current_path().string();
    return self.parent_path().string();
}

static bool is_executable(const std::string &path) {
    return g_file_test(path.c_str(), G_FILE_TEST_IS_REGULAR) &&
           g_file_test(path.c_str(), G_FILE_TEST_IS_EXECUTABLE);
}

static bool find_engine(const Config &config, const fs::path &base,
                        std::string *out, GError **error) {
    if (!config.engine_path.empty()) {
        if (is_executable(config.engine_path)) {
            *out = config.engine_path;
            return true;
        }
        g_set_error(error, VOICECLIP_ERROR, ERROR_ENGINE_NOT_FOUND,
                    "%s not found at configured path '%s'", ENGINE_NAME,
                    config.engine_path.c_str());
        return false;
    }

    fs::path bundled = base / "whisper.cpp" / "build" / "bin" / ENGINE_NAME;
    if (is_executable(bundled.string())) {
        *out = bundled.string();
        return true;
    }

    gchar *on_path = g_find_program_in_path(ENGINE_NAME);
    if (on_path != nullptr) {
        *out = on_path;
        g_free(on_path);
        return true;
    }

    g_set_error(error, VOICECLIP_ERROR, ERROR_ENGINE_NOT_FOUND,
                "%s not found in %s or on PATH", ENGINE_NAME,
                bundled.parent_path().c_str());
    return false;
}

static bool find_models_dir(const Config &config, const fs::path &base,
                            const fs::path &engine, std::string *out,
                            GError **error) {
    std::error_code ec;
    if (!config.models_dir.empty()) {
        if (fs::is_directory(config.models_dir, ec)) {
            *out = config.models_dir;
            return true;
        }
        g_set_error(error, VOICECLIP_ERROR, ERROR_MODELS_NOT_FOUND,
                    "Models directory '%s' does not exist",
                    config.models_dir.c_str());
        return false;
    }

    // whisper.cpp/build/bin/whisper-cli -> whisper.cpp/models
    const std::vector<fs::path> candidates = {
        base / "whisper.cpp" / "models",
        engine.parent_path().parent_path().parent_path() / "models",
        base / "models",
    };
    for (const auto &dir : candidates) {
        if (fs::is_directory(dir, ec)) {
            *out = dir.string();
            return true;
        }
    }

    g_set_error(error, VOICECLIP_ERROR, ERROR_MODELS_NOT_FOUND,
                "No models directory found (looked in %s)",
                candidates.front().c_str());
    return false;
}

bool locate_engine(const Config &config, const std::string &base_dir,
                   EngineLocation *location, GError **error) {
    fs::path base(base_dir);
    std::string engine;
    if (!find_engine(config, base, &engine, error)) return false;

    std::string models;
    if (!find_models_dir(config, base, fs::path(engine), &models, error)) {
        return false;
    }

    location->engine_path = engine;
    location->models_dir = models;
    return true;
}

} // namespace voiceclip
