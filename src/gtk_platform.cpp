#include "gtk_platform.h"
#include "model_catalog.h"
#include "ui_dispatch.h"

#include <utility>

namespace voiceclip {

static constexpr int PILL_WIDTH = 180;
static constexpr int PILL_HEIGHT = 44;
static constexpr int PILL_BOTTOM_MARGIN = 80;

static const char *PILL_CSS =
    "window.voiceclip-pill { background-color: transparent; }"
    "box.voiceclip-pill {"
    "  border-radius: 22px;"
    "  border: 1px solid rgba(255, 255, 255, 0.1);"
    "  background-image: linear-gradient(to bottom, rgba(38, 38, 46, 0.95),"
    "                                    rgba(20, 20, 26, 0.95));"
    "}"
    "box.voiceclip-pill.processing {"
    "  background-image: linear-gradient(to bottom, rgba(26, 38, 64, 0.95),"
    "                                    rgba(13, 20, 38, 0.95));"
    "}"
    "box.voiceclip-pill.success {"
    "  background-image: linear-gradient(to bottom, rgba(26, 56, 31, 0.95),"
    "                                    rgba(13, 31, 15, 0.95));"
    "}"
    "box.voiceclip-pill.error {"
    "  background-image: linear-gradient(to bottom, rgba(64, 26, 26, 0.95),"
    "                                    rgba(38, 13, 13, 0.95));"
    "}"
    "box.voiceclip-pill label { color: white; font-size: 15px; }";

static const char *style_class(IndicatorState state) {
    switch (state) {
    case IndicatorState::Recording:
        return "recording";
    case IndicatorState::Processing:
        return "processing";
    case IndicatorState::Success:
        return "success";
    case IndicatorState::Error:
        return "error";
    }
    return "recording";
}

// --- Status pill ---

GtkStatusPill::GtkStatusPill() {
    window_ = gtk_window_new(GTK_WINDOW_POPUP);
    gtk_window_set_default_size(GTK_WINDOW(window_), PILL_WIDTH, PILL_HEIGHT);
    gtk_window_set_keep_above(GTK_WINDOW(window_), TRUE);
    gtk_window_set_accept_focus(GTK_WINDOW(window_), FALSE);
    gtk_widget_set_app_paintable(window_, TRUE);

    GdkScreen *screen = gtk_widget_get_screen(window_);
    GdkVisual *visual = gdk_screen_get_rgba_visual(screen);
    if (visual != nullptr) {
        gtk_widget_set_visual(window_, visual);
    }

    GtkCssProvider *css = gtk_css_provider_new();
    gtk_css_provider_load_from_data(css, PILL_CSS, -1, nullptr);
    gtk_style_context_add_provider_for_screen(
        screen, GTK_STYLE_PROVIDER(css),
        GTK_STYLE_PROVIDER_PRIORITY_APPLICATION);
    g_object_unref(css);

    gtk_style_context_add_class(gtk_widget_get_style_context(window_),
                                "voiceclip-pill");

    box_ = gtk_box_new(GTK_ORIENTATION_HORIZONTAL, 0);
    gtk_style_context_add_class(gtk_widget_get_style_context(box_),
                                "voiceclip-pill");
    gtk_container_add(GTK_CONTAINER(window_), box_);

    label_ = gtk_label_new("Listening...");
    gtk_widget_set_hexpand(label_, TRUE);
    gtk_box_pack_start(GTK_BOX(box_), label_, TRUE, TRUE, 0);

    // Clicks fall through to whatever is underneath
    gtk_widget_realize(window_);
    cairo_region_t *empty = cairo_region_create();
    gtk_widget_input_shape_combine_region(window_, empty);
    cairo_region_destroy(empty);
}

GtkStatusPill::~GtkStatusPill() {
    if (window_ != nullptr) {
        gtk_widget_destroy(window_);
        window_ = nullptr;
    }
}

void GtkStatusPill::set_style(IndicatorState state) {
    GtkStyleContext *ctx = gtk_widget_get_style_context(box_);
    for (auto s : {IndicatorState::Recording, IndicatorState::Processing,
                   IndicatorState::Success, IndicatorState::Error}) {
        gtk_style_context_remove_class(ctx, style_class(s));
    }
    gtk_style_context_add_class(ctx, style_class(state));
}

void GtkStatusPill::move_to_bottom_center() {
    GdkDisplay *display = gdk_display_get_default();
    GdkMonitor *monitor = gdk_display_get_primary_monitor(display);
    if (monitor == nullptr) monitor = gdk_display_get_monitor(display, 0);
    if (monitor == nullptr) return;

    GdkRectangle area;
    gdk_monitor_get_workarea(monitor, &area);
    gtk_window_move(GTK_WINDOW(window_), area.x + (area.width - PILL_WIDTH) / 2,
                    area.y + area.height - PILL_HEIGHT - PILL_BOTTOM_MARGIN);
}

void GtkStatusPill::show(const std::string &text) {
    run_on_ui([this, text] {
        gtk_label_set_text(GTK_LABEL(label_), text.c_str());
        set_style(IndicatorState::Recording);
        move_to_bottom_center();
        gtk_widget_show_all(window_);
    });
}

void GtkStatusPill::update(const std::string &text, IndicatorState state) {
    run_on_ui([this, text, state] {
        gtk_label_set_text(GTK_LABEL(label_), text.c_str());
        set_style(state);
    });
}

void GtkStatusPill::hide() {
    run_on_ui([this] { gtk_widget_hide(window_); });
}

// --- Clipboard ---

void GtkClipboardWriter::copy(const std::string &text) {
    run_on_ui([text] {
        GtkClipboard *clipboard = gtk_clipboard_get(GDK_SELECTION_CLIPBOARD);
        gtk_clipboard_set_text(clipboard, text.c_str(), -1);
        // Let a clipboard manager keep the text after we quit
        gtk_clipboard_set_can_store(clipboard, nullptr, 0);
    });
}

// --- Tray ---

static void show_message(GtkMessageType type, const char *title,
                         const std::string &body) {
    GtkWidget *dialog = gtk_message_dialog_new(
        nullptr, GTK_DIALOG_MODAL, type, GTK_BUTTONS_OK, "%s", title);
    gtk_message_dialog_format_secondary_text(GTK_MESSAGE_DIALOG(dialog), "%s",
                                             body.c_str());
    gtk_window_set_title(GTK_WINDOW(dialog), title);
    gtk_dialog_run(GTK_DIALOG(dialog));
    gtk_widget_destroy(dialog);
}

static const char *tray_icon(SessionState state) {
    switch (state) {
    case SessionState::Recording:
        return "media-record";
    case SessionState::Transcribing:
    case SessionState::Displaying:
        return "emblem-synchronizing";
    case SessionState::Idle:
        break;
    }
    return "audio-input-microphone";
}

AppIndicatorTray::AppIndicatorTray(ModelSelection &models,
                                   std::string hotkey_description)
    : models_(models), hotkey_description_(std::move(hotkey_description)) {
    menu_ = gtk_menu_new();

    status_item_ = gtk_menu_item_new_with_label("Status: Ready");
    gtk_widget_set_sensitive(status_item_, FALSE);
    gtk_menu_shell_append(GTK_MENU_SHELL(menu_), status_item_);

    gtk_menu_shell_append(GTK_MENU_SHELL(menu_), gtk_separator_menu_item_new());

    GtkWidget *model_item = gtk_menu_item_new_with_label("Whisper Model");
    gtk_menu_item_set_submenu(GTK_MENU_ITEM(model_item), build_model_menu());
    gtk_menu_shell_append(GTK_MENU_SHELL(menu_), model_item);

    gtk_menu_shell_append(GTK_MENU_SHELL(menu_), gtk_separator_menu_item_new());

    GtkWidget *help_item = gtk_menu_item_new_with_label("How to Use");
    g_signal_connect(help_item, "activate", G_CALLBACK(on_help), this);
    gtk_menu_shell_append(GTK_MENU_SHELL(menu_), help_item);

    GtkWidget *about_item = gtk_menu_item_new_with_label("About");
    g_signal_connect(about_item, "activate", G_CALLBACK(on_about), this);
    gtk_menu_shell_append(GTK_MENU_SHELL(menu_), about_item);

    gtk_menu_shell_append(GTK_MENU_SHELL(menu_), gtk_separator_menu_item_new());

    GtkWidget *quit_item = gtk_menu_item_new_with_label("Quit");
    g_signal_connect(quit_item, "activate", G_CALLBACK(on_quit), nullptr);
    gtk_menu_shell_append(GTK_MENU_SHELL(menu_), quit_item);

    gtk_widget_show_all(menu_);

    G_GNUC_BEGIN_IGNORE_DEPRECATIONS
    indicator_ = app_indicator_new("voiceclip", tray_icon(SessionState::Idle),
                                   APP_INDICATOR_CATEGORY_APPLICATION_STATUS);
    G_GNUC_END_IGNORE_DEPRECATIONS
    app_indicator_set_status(indicator_, APP_INDICATOR_STATUS_ACTIVE);
    app_indicator_set_menu(indicator_, GTK_MENU(menu_));
}

AppIndicatorTray::~AppIndicatorTray() {
    if (indicator_ != nullptr) {
        g_object_unref(indicator_);
        indicator_ = nullptr;
    }
}

GtkWidget *AppIndicatorTray::build_model_menu() {
    GtkWidget *submenu = gtk_menu_new();
    GSList *group = nullptr;

    for (const auto &model : model_catalog()) {
        GtkWidget *widget = gtk_radio_menu_item_new_with_label(
            group, models_.menu_label(model).c_str());
        group = gtk_radio_menu_item_get_group(GTK_RADIO_MENU_ITEM(widget));

        auto item = std::make_unique<ModelItem>(ModelItem{this, &model, widget});
        g_signal_connect(widget, "toggled", G_CALLBACK(on_model_toggled),
                         item.get());
        model_items_.push_back(std::move(item));

        gtk_menu_shell_append(GTK_MENU_SHELL(submenu), widget);
    }

    refresh_model_items();
    return submenu;
}

// Relabels items and re-checks the active model without re-entering
// on_model_toggled
void AppIndicatorTray::refresh_model_items() {
    syncing_ = true;
    for (const auto &item : model_items_) {
        gtk_menu_item_set_label(GTK_MENU_ITEM(item->widget),
                                models_.menu_label(*item->model).c_str());
        if (item->model == &models_.current()) {
            gtk_check_menu_item_set_active(GTK_CHECK_MENU_ITEM(item->widget),
                                           TRUE);
        }
    }
    syncing_ = false;
}

void AppIndicatorTray::on_model_toggled(GtkCheckMenuItem *widget,
                                        gpointer userdata) {
    auto *item = static_cast<ModelItem *>(userdata);
    AppIndicatorTray *tray = item->tray;

    if (tray->syncing_ || !gtk_check_menu_item_get_active(widget)) return;

    GError *error = nullptr;
    if (tray->models_.select(item->model->name, &error)) {
        g_message("Switched to: %s (%s)", item->model->name.c_str(),
                  item->model->size.c_str());
    } else {
        g_warning("Model change rejected: %s", error->message);
        show_message(GTK_MESSAGE_WARNING, "Model Not Found",
                     item->model->name + " is not downloaded yet.");
        g_error_free(error);
    }
    tray->refresh_model_items();
}

void AppIndicatorTray::on_help(GtkMenuItem * /*item*/, gpointer userdata) {
    auto *tray = static_cast<AppIndicatorTray *>(userdata);
    std::string body =
        "1. Hold " + tray->hotkey_description_ + " together\n\n"
        "2. Speak clearly into your microphone\n\n"
        "3. Release either key when done\n\n"
        "4. Your speech is transcribed and copied to clipboard\n\n"
        "5. Press Ctrl+V anywhere to paste!";
    show_message(GTK_MESSAGE_INFO, "How to Use voiceclip", body);
}

void AppIndicatorTray::on_about(GtkMenuItem * /*item*/, gpointer /*userdata*/) {
    std::string body = std::string("voiceclip ") + VOICECLIP_VERSION +
                       "\n\nSpeak, transcribe, paste anywhere.\n\n"
                       "Powered by whisper.cpp\n"
                       "All processing happens locally on your device.";
    show_message(GTK_MESSAGE_INFO, "About voiceclip", body);
}

void AppIndicatorTray::on_quit(GtkMenuItem * /*item*/, gpointer /*userdata*/) {
    g_application_quit(g_application_get_default());
}

void AppIndicatorTray::set_session_state(SessionState state) {
    run_on_ui([this, state] {
        std::string label = std::string("Status: ") + session_state_name(state);
        gtk_menu_item_set_label(GTK_MENU_ITEM(status_item_), label.c_str());
        app_indicator_set_icon_full(indicator_, tray_icon(state),
                                    session_state_name(state));
    });
}

// --- Platform ---

GtkPlatform::GtkPlatform(ModelSelection &models,
                         const std::string &hotkey_description)
    : tray_(models, hotkey_description) {}

std::unique_ptr<Platform> create_platform(ModelSelection &models,
                                          const std::string &hotkey_description) {
    return std::make_unique<GtkPlatform>(models, hotkey_description);
}

} // namespace voiceclip
