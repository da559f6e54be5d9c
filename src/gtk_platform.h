#ifndef VOICECLIP_GTK_PLATFORM_H
#define VOICECLIP_GTK_PLATFORM_H

#include "platform.h"

#include <gtk/gtk.h>
#include <libayatana-appindicator/app-indicator.h>

#include <memory>
#include <string>
#include <vector>

namespace voiceclip {

class ModelSelection;
struct ModelInfo;

// Floating pill near the bottom of the primary monitor
class GtkStatusPill : public StatusIndicator {
public:
    GtkStatusPill();
    ~GtkStatusPill() override;

    void show(const std::string &text) override;
    void update(const std::string &text, IndicatorState state) override;
    void hide() override;

private:
    void set_style(IndicatorState state);
    void move_to_bottom_center();

    GtkWidget *window_ = nullptr;
    GtkWidget *box_ = nullptr;
    GtkWidget *label_ = nullptr;
};

class GtkClipboardWriter : public ClipboardWriter {
public:
    void copy(const std::string &text) override;
};

class AppIndicatorTray : public TrayMenu {
public:
    AppIndicatorTray(ModelSelection &models, std::string hotkey_description);
    ~AppIndicatorTray() override;

    void set_session_state(SessionState state) override;

private:
    struct ModelItem {
        AppIndicatorTray *tray;
        const ModelInfo *model;
        GtkWidget *widget;
    };

    GtkWidget *build_model_menu();
    void refresh_model_items();

    static void on_model_toggled(GtkCheckMenuItem *item, gpointer userdata);
    static void on_help(GtkMenuItem *item, gpointer userdata);
    static void on_about(GtkMenuItem *item, gpointer userdata);
    static void on_quit(GtkMenuItem *item, gpointer userdata);

    ModelSelection &models_;
    std::string hotkey_description_;
    AppIndicator *indicator_ = nullptr;
    GtkWidget *menu_ = nullptr;
    GtkWidget *status_item_ = nullptr;
    std::vector<std::unique_ptr<ModelItem>> model_items_;
    bool syncing_ = false;
};

class GtkPlatform : public Platform {
public:
    GtkPlatform(ModelSelection &models, const std::string &hotkey_description);

    StatusIndicator &indicator() override { return pill_; }
    ClipboardWriter &clipboard() override { return clipboard_; }
    TrayMenu &tray() override { return tray_; }

private:
    GtkStatusPill pill_;
    GtkClipboardWriter clipboard_;
    AppIndicatorTray tray_;
};

std::unique_ptr<Platform> create_platform(ModelSelection &models,
                                          const std::string &hotkey_description);

} // namespace voiceclip

#endif
