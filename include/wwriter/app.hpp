#pragma once

#include "config.hpp"
#include "audio_capture.hpp"
#include "transcriber.hpp"
#include "command_processor.hpp"
#include "activation_controller.hpp"
#include "hotkey_manager.hpp"
#include "clipboard.hpp"
#include "status_display.hpp"

#include <memory>
#include <atomic>
#include <string>

namespace wwriter {

class App {
public:
    App();
    ~App();

    // Initialize all components
    bool initialize(const Config& config);
    void shutdown();

    // Run the application (blocking)
    int run();

    // Stop the application (signal-safe)
    void quit() { should_quit_.store(true); }

    // Abort the current recording (signal-safe)
    void request_cancel() { cancel_requested_.store(true); }

private:
    std::unique_ptr<RecordingSession> create_session(uint64_t id,
                                                     RecordingSession::FinishedCallback on_finished);
    void on_hotkey(bool pressed);
    void on_transcription_complete(const std::string& text);

    Config config_;
    std::unique_ptr<AudioCapture> audio_;
    std::unique_ptr<TranscriptionEngine> engine_;
    std::unique_ptr<CommandProcessor> commands_;
    std::unique_ptr<StatusDisplay> status_;
    std::unique_ptr<InputInjector> injector_;
    std::unique_ptr<ActivationController> controller_;
    std::unique_ptr<HotkeyManager> hotkey_;

    std::atomic<bool> should_quit_{false};
    std::atomic<bool> cancel_requested_{false};
};

} // namespace wwriter
