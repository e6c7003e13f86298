#include "wwriter/status_display.hpp"
#include <iostream>
#include <mutex>

// Linux status display - console only, no tray dependencies

namespace wwriter {

void ConsoleStatusDisplay::update(SessionState state, const std::string& text) {
    static std::mutex output_mutex;

    const char* state_str = "";
    switch (state) {
        case SessionState::Idle:
            state_str = "Ready";
            break;
        case SessionState::Recording:
            state_str = "Recording...";
            break;
        case SessionState::Transcribing:
            state_str = "Transcribing...";
            break;
        case SessionState::Stopped:
            state_str = "Done";
            break;
    }

    std::lock_guard<std::mutex> lock(output_mutex);
    std::cout << "[wwriter] " << state_str;
    if (!text.empty()) {
        std::cout << " \"" << text << "\"";
    }
    std::cout << std::endl;
}

} // namespace wwriter
