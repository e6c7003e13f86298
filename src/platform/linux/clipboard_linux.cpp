#include "wwriter/clipboard.hpp"
#include <iostream>
#include <cstdio>
#include <thread>
#include <chrono>

#include <X11/Xlib.h>
#include <X11/keysym.h>
#include <X11/extensions/XTest.h>

namespace wwriter {

namespace {

// Clipboard helpers tried in order
const char* const CLIPBOARD_COMMANDS[] = {
    "xclip -selection clipboard 2>/dev/null",
    "xsel --clipboard --input 2>/dev/null",
    "wl-copy 2>/dev/null",
};

bool pipe_to_command(const char* command, const std::string& text) {
    FILE* pipe = popen(command, "w");
    if (!pipe) return false;

    size_t written = fwrite(text.data(), 1, text.size(), pipe);
    int ret = pclose(pipe);
    return written == text.size() && ret == 0;
}

// Press modifier + key, release in reverse order
bool send_key_combo(Display* display, KeySym modifier, KeySym key) {
    KeyCode mod_code = XKeysymToKeycode(display, modifier);
    KeyCode key_code = XKeysymToKeycode(display, key);
    if (mod_code == 0 || key_code == 0) {
        std::cerr << "Failed to get keycodes" << std::endl;
        return false;
    }

    XTestFakeKeyEvent(display, mod_code, True, CurrentTime);
    XTestFakeKeyEvent(display, key_code, True, CurrentTime);
    XTestFakeKeyEvent(display, key_code, False, CurrentTime);
    XTestFakeKeyEvent(display, mod_code, False, CurrentTime);
    XFlush(display);
    return true;
}

} // namespace

bool Clipboard::set_text(const std::string& text) {
    for (const char* command : CLIPBOARD_COMMANDS) {
        if (pipe_to_command(command, text)) return true;
    }

    std::cerr << "Failed to set clipboard. Install xclip, xsel or wl-clipboard." << std::endl;
    return false;
}

bool Clipboard::paste() {
    Display* display = XOpenDisplay(nullptr);
    if (!display) {
        std::cerr << "Failed to open X display" << std::endl;
        return false;
    }

    int event_base, error_base, major, minor;
    if (!XTestQueryExtension(display, &event_base, &error_base, &major, &minor)) {
        std::cerr << "XTest extension not available" << std::endl;
        XCloseDisplay(display);
        return false;
    }

    bool ok = send_key_combo(display, XK_Control_L, XK_v);
    XCloseDisplay(display);
    return ok;
}

bool ClipboardInjector::inject(const std::string& text) {
    if (text.empty()) return true;

    if (!Clipboard::set_text(text)) {
        return false;
    }

    // Delay to ensure clipboard is fully set before pasting
    std::this_thread::sleep_for(std::chrono::milliseconds(paste_delay_ms_));
    return Clipboard::paste();
}

} // namespace wwriter
