#pragma once

#include <functional>
#include <atomic>
#include <thread>
#include <cstdint>

namespace wwriter {

// Global activation key listener. The callback gets one press per release;
// auto-repeat is filtered out.
class HotkeyManager {
public:
    using HotkeyCallback = std::function<void(bool pressed)>;

    HotkeyManager();
    ~HotkeyManager();

    bool initialize();
    void shutdown();

    // Linux evdev keycode (KEY_* from linux/input-event-codes.h)
    void set_hotkey(uint32_t keycode);
    uint32_t hotkey() const { return keycode_; }

    // Set callback for key press/release. Runs on the listener thread.
    void set_callback(HotkeyCallback callback) { callback_ = callback; }

    // Start/stop listening
    bool start();
    void stop();
    bool is_running() const { return running_.load(); }

private:
    void run_loop();
    void handle_key(int value);

    uint32_t keycode_ = 0;
    HotkeyCallback callback_;
    bool key_pressed_ = false;

    std::atomic<bool> running_{false};
    std::thread listener_thread_;

    // Platform-specific handle
    void* platform_handle_ = nullptr;
};

} // namespace wwriter
