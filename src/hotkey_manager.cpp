#include "wwriter/hotkey_manager.hpp"

namespace wwriter {

HotkeyManager::HotkeyManager() = default;

HotkeyManager::~HotkeyManager() {
    shutdown();
}

void HotkeyManager::set_hotkey(uint32_t keycode) {
    keycode_ = keycode;
}

// evdev value: 1 = press, 0 = release, 2 = auto-repeat (ignored)
void HotkeyManager::handle_key(int value) {
    if (value == 1 && !key_pressed_) {
        key_pressed_ = true;
        if (callback_) callback_(true);
    } else if (value == 0 && key_pressed_) {
        key_pressed_ = false;
        if (callback_) callback_(false);
    }
}

// Platform-specific implementations in platform/*/hotkey_*.cpp

} // namespace wwriter
