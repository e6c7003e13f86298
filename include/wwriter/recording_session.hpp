#pragma once

#include "audio_source.hpp"
#include "command_processor.hpp"
#include "config.hpp"
#include "transcriber.hpp"

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <string>
#include <thread>

namespace wwriter {

enum class SessionState {
    Idle,
    Recording,
    Transcribing,
    Stopped
};

const char* session_state_name(SessionState state);

struct SessionResult {
    uint64_t session_id = 0;
    std::string text;       // Final post-processed text, empty on cancel or failure
    bool cancelled = false;
    bool failed = false;    // Audio capture could not start, nothing was recorded
};

struct SessionOptions {
    int sample_rate = 16000;
    int min_duration_ms = 0;        // Shorter recordings are discarded
    bool stop_on_silence = false;   // End capture after speech + silence_duration_ms
    int silence_duration_ms = 900;
    PostProcessingConfig post_processing;
};

// One capture -> transcribe -> post-process cycle on its own worker thread.
//
// Idle -> Recording on start(). The worker drains the audio source until
// stop_recording() (or trailing silence), then runs Transcribing -> Stopped
// through engine, commands and post-processing. cancel() while Recording goes
// straight to Stopped with an empty result. The finished callback fires
// exactly once, from the worker thread.
class RecordingSession {
public:
    using StatusCallback = std::function<void(SessionState state, const std::string& text)>;
    using FinishedCallback = std::function<void(const SessionResult& result)>;

    RecordingSession(uint64_t id,
                     AudioSource& audio,
                     TranscriptionEngine& engine,
                     const CommandProcessor& commands,
                     const SessionOptions& options,
                     StatusCallback on_status,
                     FinishedCallback on_finished);
    ~RecordingSession();

    RecordingSession(const RecordingSession&) = delete;
    RecordingSession& operator=(const RecordingSession&) = delete;

    // Idle -> Recording and spawn the worker. False if already started.
    bool start();

    // Finish capture and transcribe. False unless Recording.
    bool stop_recording();

    // Abort capture, discard the audio. False unless Recording.
    bool cancel();

    // Recording or Transcribing
    bool is_active() const;

    SessionState state() const;
    uint64_t id() const { return id_; }

    // Wait for the worker to exit (no-op from the worker itself)
    void join();

private:
    void run();
    std::string process_audio(AudioBuffer audio);
    void emit_status(SessionState state, const std::string& text = "");

    const uint64_t id_;
    AudioSource& audio_;
    TranscriptionEngine& engine_;
    const CommandProcessor& commands_;
    SessionOptions options_;
    StatusCallback on_status_;
    FinishedCallback on_finished_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    SessionState state_ = SessionState::Idle;
    std::atomic<bool> stop_requested_{false};
    std::atomic<bool> cancelled_{false};

    std::thread worker_;
};

} // namespace wwriter
