#include "wwriter/app.hpp"
#include "wwriter/completion_sound.hpp"
#include <iostream>
#include <thread>
#include <chrono>

namespace wwriter {

App::App() = default;

App::~App() {
    shutdown();
}

bool App::initialize(const Config& config) {
    config_ = config;
    const auto& rec = config_.recording_options;

    // Initialize audio capture
    audio_ = std::make_unique<AudioCapture>(rec.sample_rate, rec.sound_device);
    if (!audio_->initialize()) {
        std::cerr << "Failed to initialize audio capture" << std::endl;
        return false;
    }
    std::cout << "Audio capture initialized" << std::endl;

    // Backend is chosen once; a model that fails to load leaves the engine
    // answering every session with an empty transcript
    engine_ = std::make_unique<TranscriptionEngine>(create_backend(config_));
    if (!engine_->is_ready()) {
        std::cerr << "Transcription backend failed to initialize, transcripts will be empty" << std::endl;
    } else {
        std::cout << "Transcriber initialized (backend: " << backend_kind_name(engine_->backend_kind())
                  << ")" << std::endl;
    }

    CommandRegistry registry;
    register_default_commands(registry);
    commands_ = std::make_unique<CommandProcessor>(std::move(registry));

    if (!config_.misc.hide_status_window) {
        status_ = std::make_unique<ConsoleStatusDisplay>();
    }
    injector_ = std::make_unique<ClipboardInjector>(config_.post_processing.paste_delay_ms);

    controller_ = std::make_unique<ActivationController>(
        rec.recording_mode,
        [this](uint64_t id, RecordingSession::FinishedCallback on_finished) {
            return create_session(id, std::move(on_finished));
        },
        [this](const std::string& text) { on_transcription_complete(text); });

    // Initialize hotkey manager
    hotkey_ = std::make_unique<HotkeyManager>();
    if (!hotkey_->initialize()) {
        std::cerr << "Failed to initialize hotkey manager" << std::endl;
        return false;
    }
    hotkey_->set_hotkey(rec.activation_key != 0 ? rec.activation_key : DEFAULT_HOTKEY);
    hotkey_->set_callback([this](bool pressed) { on_hotkey(pressed); });
    std::cout << "Hotkey manager initialized" << std::endl;

    return true;
}

void App::shutdown() {
    should_quit_.store(true);

    // Stop producing events before the controller goes away
    if (hotkey_) {
        hotkey_->stop();
        hotkey_.reset();
    }

    if (controller_) {
        controller_->shutdown();
        controller_.reset();
    }

    if (audio_) {
        audio_->shutdown();
        audio_.reset();
    }

    engine_.reset();
}

int App::run() {
    controller_->start();

    if (!hotkey_->start()) {
        std::cerr << "Failed to start hotkey listener" << std::endl;
        return 1;
    }

    std::cout << "\n=== wwriter ready ===" << std::endl;
    switch (config_.recording_options.recording_mode) {
        case RecordingMode::PressToToggle:
            std::cout << "Press the hotkey to start recording, press again to transcribe." << std::endl;
            break;
        case RecordingMode::HoldToRecord:
            std::cout << "Hold the hotkey to record, release to transcribe." << std::endl;
            break;
        case RecordingMode::Continuous:
            std::cout << "Press the hotkey to start continuous dictation, press again to stop." << std::endl;
            break;
    }
    std::cout << std::endl;

    while (!should_quit_.load()) {
        if (cancel_requested_.exchange(false)) {
            controller_->cancel_session();
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }

    return 0;
}

std::unique_ptr<RecordingSession> App::create_session(uint64_t id,
                                                      RecordingSession::FinishedCallback on_finished) {
    const auto& rec = config_.recording_options;

    SessionOptions options;
    options.sample_rate = rec.sample_rate;
    options.min_duration_ms = rec.min_duration;
    options.stop_on_silence = rec.recording_mode == RecordingMode::Continuous;
    options.silence_duration_ms = rec.silence_duration;
    options.post_processing = config_.post_processing;

    RecordingSession::StatusCallback on_status;
    if (status_) {
        StatusDisplay* display = status_.get();
        on_status = [display](SessionState state, const std::string& text) {
            display->update(state, text);
        };
    }

    return std::make_unique<RecordingSession>(id, *audio_, *engine_, *commands_, options,
                                              std::move(on_status), std::move(on_finished));
}

void App::on_hotkey(bool pressed) {
    if (pressed) {
        controller_->on_activate();
    } else {
        controller_->on_deactivate();
    }
}

void App::on_transcription_complete(const std::string& text) {
    if (!injector_->inject(text)) {
        std::cerr << "Failed to insert transcription" << std::endl;
    }

    if (config_.misc.noise_on_completion && !play_completion_sound()) {
        std::cerr << "Completion sound unavailable" << std::endl;
    }
}

} // namespace wwriter
