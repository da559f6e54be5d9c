#ifndef VOICECLIP_X11_KEYBOARD_H
#define VOICECLIP_X11_KEYBOARD_H

#include <glib.h>

#include <cstddef>
#include <functional>
#include <string>
#include <vector>

typedef struct _XDisplay Display;

namespace voiceclip {

// Global key state for a few keys, sampled from the X server on the GLib
// main loop. Key grabs cannot report modifier releases, so the whole keymap
// is polled instead.
class X11KeyPoller {
public:
    using KeyHandler = std::function<void(size_t key_index, bool pressed)>;

    X11KeyPoller(std::vector<std::string> keysyms, KeyHandler handler);
    ~X11KeyPoller();

    X11KeyPoller(const X11KeyPoller &) = delete;
    X11KeyPoller &operator=(const X11KeyPoller &) = delete;

    bool start(GError **error);
    void stop();

private:
    static gboolean on_poll(gpointer userdata);
    void poll();

    std::vector<std::string> keysyms_;
    KeyHandler handler_;
    Display *display_ = nullptr;
    std::vector<unsigned int> keycodes_;
    std::vector<bool> pressed_;
    guint source_id_ = 0;
};

bool is_wayland_session();

} // namespace voiceclip

#endif
