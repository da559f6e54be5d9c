#include "hotkey.h"

#include <algorithm>
#include <utility>

namespace voiceclip {

HotkeyCombo::HotkeyCombo(size_t key_count, Handler on_match, Handler on_release)
    : held_(key_count, false), on_match_(std::move(on_match)),
      on_release_(std::move(on_release)) {}

void HotkeyCombo::key_changed(size_t key_index, bool pressed) {
    if (key_index >= held_.size()) return;

    held_[key_index] = pressed;
    if (pressed) {
        if (all_held() && on_match_) on_match_();
    } else if (on_release_) {
        on_release_();
    }
}

bool HotkeyCombo::all_held() const {
    return !held_.empty() &&
           std::all_of(held_.begin(), held_.end(), [](bool h) { return h; });
}

} // namespace voiceclip
