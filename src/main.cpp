#include "config.h"
#include "engine_locator.h"
#include "gtk_platform.h"
#include "hotkey.h"
#include "model_catalog.h"
#include "pulse_capture.h"
#include "session_controller.h"
#include "transcriber.h"
#include "x11_keyboard.h"

#include <gtk/gtk.h>

#include <chrono>
#include <memory>
#include <string>

using namespace voiceclip;

struct App {
    Config config;
    EngineLocation location;
    std::unique_ptr<ModelSelection> models;

    std::unique_ptr<Platform> platform;
    std::unique_ptr<PulseCapture> capture;
    std::unique_ptr<WhisperCliTranscriber> transcriber;
    std::unique_ptr<SessionController> controller;
    std::unique_ptr<HotkeyCombo> combo;
    std::unique_ptr<X11KeyPoller> keys;
};

// --- Command line ---

static gchar *opt_engine = nullptr;
static gchar *opt_models_dir = nullptr;
static gchar *opt_model = nullptr;
static gchar *opt_config = nullptr;
static gboolean opt_verbose = FALSE;
static gboolean opt_version = FALSE;

static GOptionEntry entries[] = {
    {"engine", 'e', 0, G_OPTION_ARG_FILENAME, &opt_engine,
     "Path to whisper-cli", "PATH"},
    {"models-dir", 'm', 0, G_OPTION_ARG_FILENAME, &opt_models_dir,
     "Directory containing ggml model files", "DIR"},
    {"model", 0, 0, G_OPTION_ARG_STRING, &opt_model,
     "Model to start with, e.g. \"Base (Fast)\"", "NAME"},
    {"config", 'c', 0, G_OPTION_ARG_FILENAME, &opt_config,
     "Read settings from this key file", "FILE"},
    {"verbose", 'v', 0, G_OPTION_ARG_NONE, &opt_verbose,
     "Print debug messages", nullptr},
    {"version", 0, 0, G_OPTION_ARG_NONE, &opt_version,
     "Print version and exit", nullptr},
    {nullptr, 0, 0, G_OPTION_ARG_NONE, nullptr, nullptr, nullptr},
};

static bool parse_options(int *argc, char ***argv, GError **error) {
    GOptionContext *context =
        g_option_context_new("- hold a hotkey, speak, paste the text");
    g_option_context_add_main_entries(context, entries, nullptr);
    g_option_context_add_group(context, gtk_get_option_group(FALSE));
    bool ok = g_option_context_parse(context, argc, argv, error);
    g_option_context_free(context);
    return ok;
}

static void free_options() {
    g_free(opt_engine);
    g_free(opt_models_dir);
    g_free(opt_model);
    g_free(opt_config);
}

// --- Startup ---

static bool load_settings(Config *config, GError **error) {
    bool required = opt_config != nullptr;
    std::string path = required ? opt_config : default_config_path();
    if (!load_config_file(path, required, config, error)) return false;

    apply_environment(config);

    if (opt_engine != nullptr) config->engine_path = opt_engine;
    if (opt_models_dir != nullptr) config->models_dir = opt_models_dir;
    if (opt_model != nullptr) config->default_model = opt_model;

    return validate_config(*config, error);
}

// Starts with the configured model if present, otherwise the first one that
// has been downloaded
static void choose_initial_model(ModelSelection &models) {
    if (models.is_downloaded(models.current())) return;

    g_warning("%s is not downloaded (%s)", models.current().name.c_str(),
              models.current_path().c_str());
    for (const auto &model : model_catalog()) {
        if (models.is_downloaded(model) && models.select(model.name, nullptr)) {
            g_message("Falling back to %s", model.name.c_str());
            return;
        }
    }
    g_warning("No models found in %s. %s", models.models_dir().c_str(),
              SETUP_HINT);
}

static ControllerSettings controller_settings(const Config &config) {
    ControllerSettings settings;
    settings.min_duration_seconds = config.min_duration_seconds;
    settings.dwell = std::chrono::milliseconds(config.dwell_ms);
    settings.error_dwell = std::chrono::milliseconds(config.error_dwell_ms);
    settings.max_recording_seconds = config.max_recording_seconds;
    return settings;
}

static void activate(GApplication * /*app*/, gpointer user_data) {
    auto *app = static_cast<App *>(user_data);

    // A second launch only re-activates the running instance
    if (app->controller != nullptr) return;

    std::string hotkey = describe_hotkey(app->config.hotkey_keys);

    app->platform = create_platform(*app->models, hotkey);

    app->capture = std::make_unique<PulseCapture>(app->config.audio_device);
    app->capture->connect();

    app->transcriber = std::make_unique<WhisperCliTranscriber>(
        app->location.engine_path, app->config.timeout_seconds);

    app->controller = std::make_unique<SessionController>(
        *app->platform, *app->capture, *app->transcriber, *app->models,
        controller_settings(app->config));

    SessionController *controller = app->controller.get();
    app->combo = std::make_unique<HotkeyCombo>(
        app->config.hotkey_keys.size(),
        [controller] { controller->on_hotkey_pressed(); },
        [controller] { controller->on_hotkey_released(); });

    HotkeyCombo *combo = app->combo.get();
    app->keys = std::make_unique<X11KeyPoller>(
        app->config.hotkey_keys,
        [combo](size_t index, bool pressed) { combo->key_changed(index, pressed); });

    GError *error = nullptr;
    if (!app->keys->start(&error)) {
        g_warning("Hotkey unavailable: %s", error->message);
        g_error_free(error);
        if (is_wayland_session()) {
            g_message("Global hotkeys need an X11 or XWayland session");
        }
    }

    g_message("voiceclip %s ready", VOICECLIP_VERSION);
    g_message("Engine: %s", app->location.engine_path.c_str());
    g_message("Model: %s", app->models->current().name.c_str());
    g_message("Hold %s to record, release to transcribe", hotkey.c_str());
}

int main(int argc, char *argv[]) {
    GError *error = nullptr;
    if (!parse_options(&argc, &argv, &error)) {
        g_printerr("%s\n", error->message);
        g_error_free(error);
        return 1;
    }

    if (opt_version) {
        g_print("voiceclip %s\n", VOICECLIP_VERSION);
        free_options();
        return 0;
    }

    if (opt_verbose) {
        g_log_set_debug_enabled(TRUE);
    }

    App app;
    if (!load_settings(&app.config, &error) ||
        !locate_engine(app.config, executable_dir(), &app.location, &error)) {
        g_printerr("Error: %s\n", error->message);
        if (g_error_matches(error, VOICECLIP_ERROR, ERROR_ENGINE_NOT_FOUND) ||
            g_error_matches(error, VOICECLIP_ERROR, ERROR_MODELS_NOT_FOUND)) {
            g_printerr("%s\n", SETUP_HINT);
        }
        g_error_free(error);
        free_options();
        return 1;
    }
    free_options();

    app.models = std::make_unique<ModelSelection>(app.location.models_dir,
                                                  app.config.default_model);
    choose_initial_model(*app.models);

    GtkApplication *gtk_app = gtk_application_new(
        "org.voiceclip.VoiceClip", G_APPLICATION_DEFAULT_FLAGS);

    // No windows; the tray keeps the app running
    g_application_hold(G_APPLICATION(gtk_app));
    g_signal_connect(gtk_app, "activate", G_CALLBACK(activate), &app);

    int status = g_application_run(G_APPLICATION(gtk_app), 1, argv);

    // Reverse order of construction
    if (app.keys != nullptr) app.keys->stop();
    app.keys.reset();
    app.combo.reset();
    app.controller.reset();
    app.transcriber.reset();
    app.capture.reset();
    app.platform.reset();

    g_object_unref(gtk_app);
    return status;
}
