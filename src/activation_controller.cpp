#include "wwriter/activation_controller.hpp"
#include <iostream>

namespace wwriter {

ActivationController::ActivationController(RecordingMode mode, SessionFactory factory,
                                           ResultHandler on_result)
    : mode_(mode)
    , factory_(std::move(factory))
    , on_result_(std::move(on_result)) {
}

ActivationController::~ActivationController() {
    shutdown();
}

void ActivationController::start() {
    if (running_.load()) return;

    running_.store(true);
    dispatcher_ = std::thread([this]() { dispatch_loop(); });
}

void ActivationController::shutdown() {
    if (!dispatcher_.joinable()) return;

    post({EventType::Shutdown, {}});
    dispatcher_.join();
    running_.store(false);
}

void ActivationController::on_activate() {
    post({EventType::Activate, {}});
}

void ActivationController::on_deactivate() {
    post({EventType::Deactivate, {}});
}

void ActivationController::cancel_session() {
    post({EventType::Cancel, {}});
}

void ActivationController::stop_continuous() {
    post({EventType::StopContinuous, {}});
}

bool ActivationController::has_active_session() const {
    std::lock_guard<std::mutex> lock(session_mutex_);
    return current_ && current_->is_active();
}

RecordingSession* ActivationController::current() const {
    std::lock_guard<std::mutex> lock(session_mutex_);
    return current_.get();
}

void ActivationController::post(Event event) {
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        queue_.push_back(std::move(event));
    }
    queue_cv_.notify_one();
}

void ActivationController::dispatch_loop() {
    while (true) {
        Event event;
        {
            std::unique_lock<std::mutex> lock(queue_mutex_);
            queue_cv_.wait(lock, [this]() { return !queue_.empty(); });
            event = std::move(queue_.front());
            queue_.pop_front();
        }

        switch (event.type) {
            case EventType::Activate:
                handle_activate();
                break;
            case EventType::Deactivate:
                handle_deactivate();
                break;
            case EventType::Cancel:
                handle_cancel();
                break;
            case EventType::StopContinuous:
                handle_stop_continuous();
                break;
            case EventType::SessionFinished:
                handle_session_finished(event.result);
                break;
            case EventType::Shutdown:
                handle_shutdown();
                return;
        }
    }
}

void ActivationController::handle_activate() {
    RecordingSession* session = current();

    if (!session) {
        if (mode_ == RecordingMode::Continuous) {
            continuous_loop_ = true;
        }
        start_session();
        return;
    }

    // A session exists (possibly finished, its completion still queued)
    switch (mode_) {
        case RecordingMode::PressToToggle:
            session->stop_recording();
            break;
        case RecordingMode::Continuous:
            continuous_loop_ = false;
            session->cancel();
            break;
        case RecordingMode::HoldToRecord:
            break;  // Already recording
    }
}

void ActivationController::handle_deactivate() {
    if (mode_ != RecordingMode::HoldToRecord) return;

    RecordingSession* session = current();
    if (session) {
        session->stop_recording();
    }
}

void ActivationController::handle_cancel() {
    continuous_loop_ = false;

    RecordingSession* session = current();
    if (session) {
        session->cancel();
    }
}

void ActivationController::handle_stop_continuous() {
    continuous_loop_ = false;

    RecordingSession* session = current();
    if (session) {
        session->stop_recording();
    }
}

void ActivationController::handle_session_finished(const SessionResult& result) {
    std::unique_ptr<RecordingSession> finished;
    {
        std::lock_guard<std::mutex> lock(session_mutex_);
        if (!current_ || current_->id() != result.session_id) return;
        finished = std::move(current_);
    }

    // The worker has sent its last message; wait for the thread to exit
    finished->join();
    finished.reset();

    if (!result.cancelled && !result.failed && on_result_) {
        try {
            on_result_(result.text);
        } catch (const std::exception& e) {
            std::cerr << "Failed to deliver transcription: " << e.what() << std::endl;
        }
    }

    if (result.failed && continuous_loop_) {
        // Restarting would fail the same way in a tight loop
        std::cerr << "Continuous recording stopped: audio capture unavailable" << std::endl;
        continuous_loop_ = false;
    } else if (mode_ == RecordingMode::Continuous && continuous_loop_ && !result.cancelled) {
        start_session();
    } else {
        continuous_loop_ = false;
    }
}

void ActivationController::handle_shutdown() {
    continuous_loop_ = false;

    std::unique_ptr<RecordingSession> session;
    {
        std::lock_guard<std::mutex> lock(session_mutex_);
        session = std::move(current_);
    }

    if (session) {
        // Recording is discarded, an in-flight transcription runs to completion
        session->cancel();
        session->join();
    }
}

bool ActivationController::start_session() {
    const uint64_t id = next_session_id_++;

    std::unique_ptr<RecordingSession> session = factory_(id, [this](const SessionResult& result) {
        post({EventType::SessionFinished, result});
    });
    if (!session) {
        std::cerr << "Failed to create recording session" << std::endl;
        return false;
    }

    RecordingSession* raw = session.get();
    {
        std::lock_guard<std::mutex> lock(session_mutex_);
        current_ = std::move(session);
    }

    if (!raw->start()) {
        std::lock_guard<std::mutex> lock(session_mutex_);
        current_.reset();
        return false;
    }

    sessions_started_.fetch_add(1);
    return true;
}

} // namespace wwriter
