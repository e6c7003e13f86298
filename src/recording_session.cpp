#include "wwriter/recording_session.hpp"
#include "wwriter/audio_processor.hpp"
#include "wwriter/text_processor.hpp"
#include <iostream>
#include <chrono>

namespace wwriter {

// How often the worker drains the audio source
static constexpr std::chrono::milliseconds POLL_INTERVAL{20};

const char* session_state_name(SessionState state) {
    switch (state) {
        case SessionState::Idle: return "idle";
        case SessionState::Recording: return "recording";
        case SessionState::Transcribing: return "transcribing";
        case SessionState::Stopped: return "stopped";
    }
    return "idle";
}

RecordingSession::RecordingSession(uint64_t id,
                                   AudioSource& audio,
                                   TranscriptionEngine& engine,
                                   const CommandProcessor& commands,
                                   const SessionOptions& options,
                                   StatusCallback on_status,
                                   FinishedCallback on_finished)
    : id_(id)
    , audio_(audio)
    , engine_(engine)
    , commands_(commands)
    , options_(options)
    , on_status_(std::move(on_status))
    , on_finished_(std::move(on_finished)) {
}

RecordingSession::~RecordingSession() {
    cancel();
    join();
}

bool RecordingSession::start() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ != SessionState::Idle) return false;
        state_ = SessionState::Recording;
    }

    std::cout << "Recording..." << std::endl;
    emit_status(SessionState::Recording);

    worker_ = std::thread([this]() { run(); });
    return true;
}

bool RecordingSession::stop_recording() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_ != SessionState::Recording) return false;
    stop_requested_.store(true);
    cv_.notify_all();
    return true;
}

bool RecordingSession::cancel() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_ != SessionState::Recording) return false;
    cancelled_.store(true);
    cv_.notify_all();
    return true;
}

bool RecordingSession::is_active() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_ == SessionState::Recording || state_ == SessionState::Transcribing;
}

SessionState RecordingSession::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

void RecordingSession::join() {
    if (worker_.joinable() && worker_.get_id() != std::this_thread::get_id()) {
        worker_.join();
    }
}

void RecordingSession::emit_status(SessionState state, const std::string& text) {
    if (on_status_) {
        on_status_(state, text);
    }
}

void RecordingSession::run() {
    SessionResult result;
    result.session_id = id_;

    AudioBuffer buffer;
    buffer.reserve(static_cast<size_t>(options_.sample_rate) * 30);  // 30 seconds

    SilenceDetector silence(options_.sample_rate, options_.silence_duration_ms);

    if (!audio_.start()) {
        std::cerr << "Failed to start audio capture" << std::endl;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            state_ = SessionState::Stopped;
        }
        result.failed = true;
        emit_status(SessionState::Stopped);
        if (on_finished_) on_finished_(result);
        return;
    }

    while (true) {
        {
            std::unique_lock<std::mutex> lock(mutex_);
            cv_.wait_for(lock, POLL_INTERVAL, [this]() {
                return stop_requested_.load() || cancelled_.load();
            });
            if (stop_requested_.load() || cancelled_.load()) break;
        }

        AudioBuffer chunk = audio_.read_available_samples();
        buffer.insert(buffer.end(), chunk.begin(), chunk.end());

        if (options_.stop_on_silence && silence.process(chunk)) {
            std::cout << "Silence detected, stopping recording" << std::endl;
            break;
        }
    }

    audio_.stop();
    AudioBuffer rest = audio_.read_available_samples();
    buffer.insert(buffer.end(), rest.begin(), rest.end());

    // Buffer is closed: a cancel that got in before this point wins
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (cancelled_.load()) {
            state_ = SessionState::Stopped;
            result.cancelled = true;
        } else {
            state_ = SessionState::Transcribing;
        }
    }

    if (result.cancelled) {
        std::cout << "Recording cancelled" << std::endl;
        emit_status(SessionState::Stopped);
        if (on_finished_) on_finished_(result);
        return;
    }

    std::cout << "Transcribing..." << std::endl;
    emit_status(SessionState::Transcribing);

    result.text = process_audio(std::move(buffer));

    {
        std::lock_guard<std::mutex> lock(mutex_);
        state_ = SessionState::Stopped;
    }
    emit_status(SessionState::Stopped, result.text);

    if (on_finished_) on_finished_(result);
}

std::string RecordingSession::process_audio(AudioBuffer audio) {
    if (audio.empty()) {
        std::cerr << "No audio recorded" << std::endl;
    } else if (buffer_duration_ms(audio, options_.sample_rate) < options_.min_duration_ms) {
        std::cout << "Discarded recording shorter than " << options_.min_duration_ms << "ms" << std::endl;
        return "";
    }

    try {
        TranscriptionResult transcription = engine_.transcribe(std::move(audio));
        if (!transcription.success) {
            std::cerr << "Transcription failed: " << transcription.error << std::endl;
            return "";
        }

        std::string text = TextProcessor::trim(transcription.text);
        if (text.empty()) return "";

        CommandOutcome outcome = commands_.execute(text);
        return TextProcessor(options_.post_processing).process(outcome.text);
    } catch (const std::exception& e) {
        std::cerr << "Transcription failed: " << e.what() << std::endl;
        return "";
    }
}

} // namespace wwriter
