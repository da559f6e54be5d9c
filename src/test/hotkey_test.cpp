#include <cassert>
#include <iostream>

#include "hotkey.h"

using namespace voiceclip;

int main() {
    std::cout << "[Test] Starting Hotkey Test..." << std::endl;

    int matches = 0;
    int releases = 0;
    HotkeyCombo combo(2, [&] { matches++; }, [&] { releases++; });

    // One key alone does nothing
    combo.key_changed(0, true);
    assert(matches == 0 && releases == 0);
    assert(!combo.all_held());

    // Second key completes the combination
    combo.key_changed(1, true);
    assert(matches == 1);
    assert(combo.all_held());

    // Releasing either key ends it
    combo.key_changed(0, false);
    assert(releases == 1);
    assert(!combo.all_held());

    // Re-pressing the released key while the other is still held matches again
    combo.key_changed(0, true);
    assert(matches == 2);

    combo.key_changed(1, false);
    assert(releases == 2);

    // A release outside the combination is still reported; the controller
    // ignores it when not recording
    combo.key_changed(0, false);
    assert(releases == 3);
    assert(matches == 2);

    // Out of range indices are ignored
    combo.key_changed(5, true);
    combo.key_changed(5, false);
    assert(matches == 2 && releases == 3);

    // Keys pressed in the opposite order
    combo.key_changed(1, true);
    combo.key_changed(0, true);
    assert(matches == 3);

    HotkeyCombo empty(0, [&] { matches++; }, [&] { releases++; });
    assert(!empty.all_held());
    empty.key_changed(0, true);
    assert(matches == 3);

    std::cout << "[Test] Hotkey Test Passed!" << std::endl;
    return 0;
}
