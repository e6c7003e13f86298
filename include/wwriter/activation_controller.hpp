#pragma once

#include "config.hpp"
#include "recording_session.hpp"

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

namespace wwriter {

// Maps hotkey activate/deactivate events to session start/stop/cancel.
//
//   mode             activate (idle)   activate (active)   deactivate
//   press_to_toggle  start             stop                -
//   hold_to_record   start             -                   stop
//   continuous       start loop        cancel, end loop    -
//
// All events, including session completion, are handled in order on the
// controller's dispatcher thread, which is the only place the current
// session is created or released.
class ActivationController {
public:
    using SessionFactory = std::function<std::unique_ptr<RecordingSession>(
        uint64_t session_id, RecordingSession::FinishedCallback on_finished)>;

    // Receives the text of every completed, non-cancelled session
    using ResultHandler = std::function<void(const std::string& text)>;

    ActivationController(RecordingMode mode, SessionFactory factory, ResultHandler on_result);
    ~ActivationController();

    ActivationController(const ActivationController&) = delete;
    ActivationController& operator=(const ActivationController&) = delete;

    // Start/stop the dispatcher thread. shutdown() cancels a recording
    // session and waits for a transcribing one.
    void start();
    void shutdown();
    bool is_running() const { return running_.load(); }

    // Hotkey events (any thread, never blocks on a session)
    void on_activate();
    void on_deactivate();

    // Abort the current recording (status display close action)
    void cancel_session();

    // End the continuous loop; a recording in progress is finalized
    void stop_continuous();

    RecordingMode mode() const { return mode_; }
    bool has_active_session() const;
    uint64_t sessions_started() const { return sessions_started_.load(); }

private:
    enum class EventType {
        Activate,
        Deactivate,
        Cancel,
        StopContinuous,
        SessionFinished,
        Shutdown
    };

    struct Event {
        EventType type;
        SessionResult result;
    };

    void post(Event event);
    void dispatch_loop();

    void handle_activate();
    void handle_deactivate();
    void handle_cancel();
    void handle_stop_continuous();
    void handle_session_finished(const SessionResult& result);
    void handle_shutdown();

    bool start_session();
    RecordingSession* current() const;

    const RecordingMode mode_;
    SessionFactory factory_;
    ResultHandler on_result_;

    std::mutex queue_mutex_;
    std::condition_variable queue_cv_;
    std::deque<Event> queue_;

    std::thread dispatcher_;
    std::atomic<bool> running_{false};

    mutable std::mutex session_mutex_;
    std::unique_ptr<RecordingSession> current_;

    // Dispatcher thread only
    uint64_t next_session_id_ = 1;
    bool continuous_loop_ = false;

    std::atomic<uint64_t> sessions_started_{0};
};

} // namespace wwriter
