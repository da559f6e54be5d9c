#include "config.h"
#include "error.h"
#include "model_catalog.h"

namespace voiceclip {

std::string default_config_path() {
    gchar *path = g_build_filename(g_get_user_config_dir(), "voiceclip",
                                   "voiceclip.conf", nullptr);
    std::string result(path);
    g_free(path);
    return result;
}

static bool read_string(GKeyFile *kf, const char *group, const char *key,
                        std::string *out, GError **error) {
    if (!g_key_file_has_key(kf, group, key, nullptr)) return true;
    gchar *value = g_key_file_get_string(kf, group, key, error);
    if (value == nullptr) return false;
    *out = g_strstrip(value);
    g_free(value);
    return true;
}

static bool read_int(GKeyFile *kf, const char *group, const char *key,
                     int *out, GError **error) {
    if (!g_key_file_has_key(kf, group, key, nullptr)) return true;
    GError *local_error = nullptr;
    gint value = g_key_file_get_integer(kf, group, key, &local_error);
    if (local_error != nullptr) {
        g_propagate_prefixed_error(error, local_error, "[%s] %s: ", group, key);
        return false;
    }
    *out = value;
    return true;
}

static bool read_double(GKeyFile *kf, const char *group, const char *key,
                        double *out, GError **error) {
    if (!g_key_file_has_key(kf, group, key, nullptr)) return true;
    GError *local_error = nullptr;
    gdouble value = g_key_file_get_double(kf, group, key, &local_error);
    if (local_error != nullptr) {
        g_propagate_prefixed_error(error, local_error, "[%s] %s: ", group, key);
        return false;
    }
    *out = value;
    return true;
}

bool load_config_file(const std::string &path, bool required, Config *config,
                      GError **error) {
    if (!required && !g_file_test(path.c_str(), G_FILE_TEST_EXISTS)) {
        g_debug("No config file at %s, using defaults", path.c_str());
        return true;
    }

    GKeyFile *kf = g_key_file_new();
    GError *local_error = nullptr;
    if (!g_key_file_load_from_file(kf, path.c_str(), G_KEY_FILE_NONE,
                                   &local_error)) {
        g_set_error(error, VOICECLIP_ERROR, ERROR_CONFIG,
                    "Cannot read config %s: %s", path.c_str(),
                    local_error->message);
        g_error_free(local_error);
        g_key_file_free(kf);
        return false;
    }

    bool ok = read_string(kf, "engine", "path", &config->engine_path, &local_error) &&
              read_string(kf, "engine", "models_dir", &config->models_dir, &local_error) &&
              read_int(kf, "engine", "timeout_seconds", &config->timeout_seconds, &local_error) &&
              read_string(kf, "session", "default_model", &config->default_model, &local_error) &&
              read_double(kf, "session", "min_duration_seconds", &config->min_duration_seconds, &local_error) &&
              read_int(kf, "session", "dwell_ms", &config->dwell_ms, &local_error) &&
              read_int(kf, "session", "error_dwell_ms", &config->error_dwell_ms, &local_error) &&
              read_int(kf, "session", "max_recording_seconds", &config->max_recording_seconds, &local_error) &&
              read_string(kf, "audio", "device", &config->audio_device, &local_error);

    if (ok && g_key_file_has_key(kf, "hotkey", "keys", nullptr)) {
        gsize length = 0;
        gchar **keys = g_key_file_get_string_list(kf, "hotkey", "keys",
                                                  &length, &local_error);
        if (keys == nullptr) {
            ok = false;
        } else {
            config->hotkey_keys.clear();
            for (gsize i = 0; i < length; i++) {
                config->hotkey_keys.emplace_back(g_strstrip(keys[i]));
            }
            g_strfreev(keys);
        }
    }

    g_key_file_free(kf);

    if (!ok) {
        g_set_error(error, VOICECLIP_ERROR, ERROR_CONFIG, "%s: %s",
                    path.c_str(), local_error->message);
        g_error_free(local_error);
        return false;
    }
    g_debug("Loaded config from %s", path.c_str());
    return true;
}

void apply_environment(Config *config) {
    const char *engine = g_getenv("VOICECLIP_ENGINE");
    if (engine != nullptr && engine[0] != '\0') {
        config->engine_path = engine;
    }
    const char *models = g_getenv("VOICECLIP_MODELS_DIR");
    if (models != nullptr && models[0] != '\0') {
        config->models_dir = models;
    }
}

bool validate_config(const Config &config, GError **error) {
    if (config.timeout_seconds <= 0 ||
        config.timeout_seconds > MAX_TIMEOUT_SECONDS) {
        g_set_error(error, VOICECLIP_ERROR, ERROR_CONFIG,
                    "timeout_seconds must be between 1 and %d (got %d)",
                    MAX_TIMEOUT_SECONDS, config.timeout_seconds);
        return false;
    }
    if (config.min_duration_seconds < 0.0) {
        g_set_error(error, VOICECLIP_ERROR, ERROR_CONFIG,
                    "min_duration_seconds must not be negative");
        return false;
    }
    if (config.dwell_ms < 0 || config.error_dwell_ms < 0) {
        g_set_error(error, VOICECLIP_ERROR, ERROR_CONFIG,
                    "dwell times must not be negative");
        return false;
    }
    if (config.max_recording_seconds <= 0) {
        g_set_error(error, VOICECLIP_ERROR, ERROR_CONFIG,
                    "max_recording_seconds must be positive (got %d)",
                    config.max_recording_seconds);
        return false;
    }
    if (config.hotkey_keys.size() != 2) {
        g_set_error(error, VOICECLIP_ERROR, ERROR_CONFIG,
                    "hotkey needs exactly two keys (got %zu)",
                    config.hotkey_keys.size());
        return false;
    }
    for (const auto &key : config.hotkey_keys) {
        if (key.empty()) {
            g_set_error_literal(error, VOICECLIP_ERROR, ERROR_CONFIG,
                                "hotkey key names must not be empty");
            return false;
        }
    }
    if (config.hotkey_keys[0] == config.hotkey_keys[1]) {
        g_set_error(error, VOICECLIP_ERROR, ERROR_CONFIG,
                    "hotkey keys must differ (both are %s)",
                    config.hotkey_keys[0].c_str());
        return false;
    }
    if (find_model(config.default_model) == nullptr) {
        g_set_error(error, VOICECLIP_ERROR, ERROR_UNKNOWN_MODEL,
                    "Unknown default model '%s'", config.default_model.c_str());
        return false;
    }
    return true;
}

std::string describe_key(const std::string &keysym) {
    std::string base = keysym;
    std::string side;
    if (g_str_has_suffix(keysym.c_str(), "_L")) {
        side = "Left ";
        base = keysym.substr(0, keysym.size() - 2);
    } else if (g_str_has_suffix(keysym.c_str(), "_R")) {
        side = "Right ";
        base = keysym.substr(0, keysym.size() - 2);
    }
    return side + base;
}

std::string describe_hotkey(const std::vector<std::string> &keys) {
    std::string out;
    for (const auto &key : keys) {
        if (!out.empty()) out += " + ";
        out += describe_key(key);
    }
    return out;
}

} // namespace voiceclip
