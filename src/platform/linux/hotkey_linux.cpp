#include "wwriter/hotkey_manager.hpp"
#include <iostream>
#include <string>
#include <cstring>
#include <fcntl.h>
#include <unistd.h>
#include <sys/ioctl.h>
#include <linux/input.h>
#include <sys/select.h>

#ifdef WWRITER_HAS_LIBEVDEV
#include <libevdev/libevdev.h>
#endif

namespace wwriter {

namespace {

constexpr int MAX_EVENT_DEVICES = 32;

struct LinuxHotkeyState {
    int keyboard_fd = -1;
#ifdef WWRITER_HAS_LIBEVDEV
    struct libevdev* dev = nullptr;
#endif
};

#ifndef WWRITER_HAS_LIBEVDEV
bool device_has_key(int fd, uint32_t keycode) {
    unsigned char key_bits[KEY_MAX / 8 + 1];
    std::memset(key_bits, 0, sizeof(key_bits));
    if (ioctl(fd, EVIOCGBIT(EV_KEY, sizeof(key_bits)), key_bits) < 0) return false;
    return (key_bits[keycode / 8] >> (keycode % 8)) & 1;
}
#endif

// Open the first event device that reports the hotkey
bool open_keyboard(LinuxHotkeyState* state, uint32_t keycode) {
    for (int i = 0; i < MAX_EVENT_DEVICES; ++i) {
        std::string path = "/dev/input/event" + std::to_string(i);
        int fd = open(path.c_str(), O_RDONLY | O_NONBLOCK);
        if (fd < 0) continue;

#ifdef WWRITER_HAS_LIBEVDEV
        struct libevdev* dev = nullptr;
        if (libevdev_new_from_fd(fd, &dev) >= 0) {
            if (libevdev_has_event_type(dev, EV_KEY) &&
                libevdev_has_event_code(dev, EV_KEY, keycode)) {
                state->keyboard_fd = fd;
                state->dev = dev;
                std::cout << "Using keyboard: " << path << " (" << libevdev_get_name(dev) << ")" << std::endl;
                return true;
            }
            libevdev_free(dev);
        }
#else
        if (device_has_key(fd, keycode)) {
            state->keyboard_fd = fd;
            std::cout << "Using keyboard: " << path << std::endl;
            return true;
        }
#endif
        close(fd);
    }
    return false;
}

} // namespace

bool HotkeyManager::initialize() {
    if (platform_handle_) return true;

    platform_handle_ = new LinuxHotkeyState();
    return true;
}

void HotkeyManager::shutdown() {
    stop();

    auto* state = static_cast<LinuxHotkeyState*>(platform_handle_);
    if (state) {
#ifdef WWRITER_HAS_LIBEVDEV
        if (state->dev) {
            libevdev_free(state->dev);
        }
#endif
        if (state->keyboard_fd >= 0) {
            close(state->keyboard_fd);
        }
        delete state;
    }
    platform_handle_ = nullptr;
}

bool HotkeyManager::start() {
    if (running_.load()) return true;

    auto* state = static_cast<LinuxHotkeyState*>(platform_handle_);
    if (!state) return false;

    key_pressed_ = false;

    if (keycode_ == 0 || keycode_ > KEY_MAX) {
        std::cerr << "Invalid hotkey keycode: " << keycode_ << std::endl;
        return false;
    }

    if (state->keyboard_fd < 0 && !open_keyboard(state, keycode_)) {
        std::cerr << "Failed to open keyboard device. Try running with sudo or add user to input group." << std::endl;
        return false;
    }

    running_.store(true);

    listener_thread_ = std::thread([this]() {
        run_loop();
    });

    return true;
}

void HotkeyManager::stop() {
    if (!running_.load()) return;

    running_.store(false);

    if (listener_thread_.joinable()) {
        listener_thread_.join();
    }
}

void HotkeyManager::run_loop() {
    auto* state = static_cast<LinuxHotkeyState*>(platform_handle_);
    struct input_event ev;

    while (running_.load()) {
        fd_set fds;
        FD_ZERO(&fds);
        FD_SET(state->keyboard_fd, &fds);

        struct timeval tv;
        tv.tv_sec = 0;
        tv.tv_usec = 100000; // 100ms timeout

        int ret = select(state->keyboard_fd + 1, &fds, nullptr, nullptr, &tv);
        if (ret <= 0) continue;

#ifdef WWRITER_HAS_LIBEVDEV
        int rc;
        do {
            rc = libevdev_next_event(state->dev, LIBEVDEV_READ_FLAG_NORMAL, &ev);
            if (rc == LIBEVDEV_READ_STATUS_SYNC) {
                // Dropped events, resync and keep the last known key state
                while (rc == LIBEVDEV_READ_STATUS_SYNC) {
                    rc = libevdev_next_event(state->dev, LIBEVDEV_READ_FLAG_SYNC, &ev);
                }
                continue;
            }
            if (rc == LIBEVDEV_READ_STATUS_SUCCESS && ev.type == EV_KEY && ev.code == keycode_) {
                handle_key(ev.value);
            }
        } while (rc == LIBEVDEV_READ_STATUS_SUCCESS || rc == LIBEVDEV_READ_STATUS_SYNC);
#else
        ssize_t n;
        while ((n = read(state->keyboard_fd, &ev, sizeof(ev))) == static_cast<ssize_t>(sizeof(ev))) {
            if (ev.type == EV_KEY && ev.code == keycode_) {
                handle_key(ev.value);
            }
        }
#endif
    }
}

} // namespace wwriter
