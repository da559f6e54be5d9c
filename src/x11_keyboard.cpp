#include "x11_keyboard.h"
#include "error.h"

#include <X11/Xlib.h>

#include <utility>

namespace voiceclip {

static constexpr guint POLL_INTERVAL_MS = 15;

bool is_wayland_session() {
    const char *type = g_getenv("XDG_SESSION_TYPE");
    return type != nullptr && g_strcmp0(type, "wayland") == 0;
}

X11KeyPoller::X11KeyPoller(std::vector<std::string> keysyms, KeyHandler handler)
    : keysyms_(std::move(keysyms)), handler_(std::move(handler)) {}

X11KeyPoller::~X11KeyPoller() { stop(); }

bool X11KeyPoller::start(GError **error) {
    if (display_ != nullptr) return true;

    display_ = XOpenDisplay(nullptr);
    if (display_ == nullptr) {
        g_set_error(error, VOICECLIP_ERROR, ERROR_HOTKEY,
                    "Cannot open X display '%s'", XDisplayName(nullptr));
        return false;
    }

    keycodes_.clear();
    for (const auto &name : keysyms_) {
        KeySym sym = XStringToKeysym(name.c_str());
        KeyCode code = sym == NoSymbol ? 0 : XKeysymToKeycode(display_, sym);
        if (code == 0) {
            g_set_error(error, VOICECLIP_ERROR, ERROR_HOTKEY,
                        "Key '%s' is not on this keyboard", name.c_str());
            XCloseDisplay(display_);
            display_ = nullptr;
            return false;
        }
        keycodes_.push_back(code);
    }
    pressed_.assign(keycodes_.size(), false);

    source_id_ = g_timeout_add(POLL_INTERVAL_MS, on_poll, this);
    return true;
}

void X11KeyPoller::stop() {
    if (source_id_ != 0) {
        g_source_remove(source_id_);
        source_id_ = 0;
    }
    if (display_ != nullptr) {
        XCloseDisplay(display_);
        display_ = nullptr;
    }
}

gboolean X11KeyPoller::on_poll(gpointer userdata) {
    static_cast<X11KeyPoller *>(userdata)->poll();
    return G_SOURCE_CONTINUE;
}

void X11KeyPoller::poll() {
    char keys[32];
    XQueryKeymap(display_, keys);

    for (size_t i = 0; i < keycodes_.size(); i++) {
        unsigned int code = keycodes_[i];
        bool down = (keys[code / 8] & (1 << (code % 8))) != 0;
        if (down != pressed_[i]) {
            pressed_[i] = down;
            if (handler_) handler_(i, down);
        }
    }
}

} // namespace voiceclip
