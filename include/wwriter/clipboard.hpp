#pragma once

#include <string>

namespace wwriter {

class Clipboard {
public:
    // Set text to clipboard
    static bool set_text(const std::string& text);

    // Paste clipboard content (simulates Ctrl+V)
    static bool paste();
};

// Delivers final text to the focused input
class InputInjector {
public:
    virtual ~InputInjector() = default;

    virtual bool inject(const std::string& text) = 0;
};

// Clipboard + simulated Ctrl+V
class ClipboardInjector : public InputInjector {
public:
    explicit ClipboardInjector(int paste_delay_ms = 100) : paste_delay_ms_(paste_delay_ms) {}

    bool inject(const std::string& text) override;

private:
    int paste_delay_ms_;
};

} // namespace wwriter
