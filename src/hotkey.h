#ifndef VOICECLIP_HOTKEY_H
#define VOICECLIP_HOTKEY_H

#include <cstddef>
#include <functional>
#include <vector>

namespace voiceclip {

// Tracks a set of keys that must all be held. Every press that leaves the
// whole set held reports a match, every release of a member reports a
// release; repeated events are left for the receiver to ignore.
class HotkeyCombo {
public:
    using Handler = std::function<void()>;

    HotkeyCombo(size_t key_count, Handler on_match, Handler on_release);

    void key_changed(size_t key_index, bool pressed);

    bool all_held() const;

private:
    std::vector<bool> held_;
    Handler on_match_;
    Handler on_release_;
};

} // namespace voiceclip

#endif
