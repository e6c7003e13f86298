// Automated tests for ActivationController

#include "wwriter/activation_controller.hpp"
#include "mock_pipeline.hpp"
#include <iostream>
#include <cassert>
#include <mutex>
#include <random>
#include <vector>

using namespace wwriter;
using wwriter::testing::MockAudioSource;
using wwriter::testing::MockBackend;
using wwriter::testing::wait_until;

// Wires a controller to mock audio and backend and tracks how many
// sessions are recording or transcribing at once
class Harness {
public:
    explicit Harness(RecordingMode mode, bool stop_on_silence = false) {
        auto mock = std::make_unique<MockBackend>("Hello world.");
        backend_ = mock.get();
        engine_ = std::make_unique<TranscriptionEngine>(std::move(mock));

        options_.min_duration_ms = 0;
        options_.stop_on_silence = stop_on_silence;
        options_.silence_duration_ms = 100;

        controller_ = std::make_unique<ActivationController>(
            mode,
            [this](uint64_t id, RecordingSession::FinishedCallback on_finished) {
                return std::make_unique<RecordingSession>(
                    id, audio_, *engine_, commands_, options_,
                    [this](SessionState state, const std::string&) { on_status(state); },
                    std::move(on_finished));
            },
            [this](const std::string& text) {
                std::lock_guard<std::mutex> lock(mutex_);
                results_.push_back(text);
            });
        controller_->start();
    }

    ~Harness() {
        controller_->shutdown();
    }

    ActivationController& controller() { return *controller_; }
    MockAudioSource& audio() { return audio_; }
    MockBackend& backend() { return *backend_; }

    size_t result_count() {
        std::lock_guard<std::mutex> lock(mutex_);
        return results_.size();
    }

    std::string result(size_t i) {
        std::lock_guard<std::mutex> lock(mutex_);
        return results_.at(i);
    }

    int max_active() {
        std::lock_guard<std::mutex> lock(mutex_);
        return max_active_;
    }

    int active() {
        std::lock_guard<std::mutex> lock(mutex_);
        return active_;
    }

    bool wait_started(uint64_t count) {
        return wait_until([&]() { return controller_->sessions_started() >= count; });
    }

    bool wait_idle() {
        return wait_until([&]() { return !controller_->has_active_session() && active() == 0; });
    }

    void settle(int ms = 60) {
        std::this_thread::sleep_for(std::chrono::milliseconds(ms));
    }

private:
    void on_status(SessionState state) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state == SessionState::Recording) {
            active_++;
            if (active_ > max_active_) max_active_ = active_;
        } else if (state == SessionState::Stopped) {
            active_--;
        }
    }

    MockAudioSource audio_;
    MockBackend* backend_ = nullptr;
    std::unique_ptr<TranscriptionEngine> engine_;
    CommandProcessor commands_;
    SessionOptions options_;

    std::mutex mutex_;
    std::vector<std::string> results_;
    int active_ = 0;
    int max_active_ = 0;

    std::unique_ptr<ActivationController> controller_;
};

void test_press_to_toggle() {
    std::cout << "Testing press_to_toggle..." << std::endl;

    Harness h(RecordingMode::PressToToggle);
    auto& ctl = h.controller();
    assert(ctl.is_running());
    assert(ctl.mode() == RecordingMode::PressToToggle);

    ctl.on_activate();
    assert(h.wait_started(1));
    assert(ctl.has_active_session());

    // Release does nothing in this mode
    ctl.on_deactivate();
    h.settle();
    assert(ctl.has_active_session());

    ctl.on_activate();
    assert(wait_until([&]() { return h.result_count() == 1; }));
    assert(h.result(0) == "Hello world. ");
    assert(h.wait_idle());
    assert(ctl.sessions_started() == 1);

    // Next press starts a fresh session
    ctl.on_activate();
    assert(h.wait_started(2));
    ctl.on_activate();
    assert(wait_until([&]() { return h.result_count() == 2; }));
    assert(h.max_active() == 1);

    std::cout << "  PASS" << std::endl;
}

void test_hold_to_record() {
    std::cout << "Testing hold_to_record..." << std::endl;

    Harness h(RecordingMode::HoldToRecord);
    auto& ctl = h.controller();

    // Release without a session is ignored
    ctl.on_deactivate();
    h.settle();
    assert(ctl.sessions_started() == 0);
    assert(!ctl.has_active_session());

    ctl.on_activate();
    assert(h.wait_started(1));

    // Repeated press while held does not start another session
    ctl.on_activate();
    h.settle();
    assert(ctl.sessions_started() == 1);
    assert(ctl.has_active_session());

    ctl.on_deactivate();
    assert(wait_until([&]() { return h.result_count() == 1; }));
    assert(h.result(0) == "Hello world. ");
    assert(h.wait_idle());
    assert(h.backend().calls() == 1);

    std::cout << "  PASS" << std::endl;
}

void test_cancel_session() {
    std::cout << "Testing cancel..." << std::endl;

    Harness h(RecordingMode::PressToToggle);
    auto& ctl = h.controller();

    // Cancel without a session is harmless
    ctl.cancel_session();
    h.settle();

    ctl.on_activate();
    assert(h.wait_started(1));
    h.settle();
    ctl.cancel_session();
    assert(h.wait_idle());
    h.settle();

    assert(h.result_count() == 0);
    assert(h.backend().calls() == 0);

    std::cout << "  PASS" << std::endl;
}

void test_continuous_restarts_until_activated() {
    std::cout << "Testing continuous loop..." << std::endl;

    Harness h(RecordingMode::Continuous, true);
    auto& ctl = h.controller();
    h.audio().set_samples(1600, 8000);  // speech

    ctl.on_activate();
    assert(h.wait_started(1));
    h.settle(100);

    // Trailing silence ends the first session and the loop starts another
    h.audio().set_samples(1600, 0);
    assert(wait_until([&]() { return h.result_count() == 1; }));
    assert(h.result(0) == "Hello world. ");
    assert(h.wait_started(2));

    // Still silent: the second session keeps recording
    h.settle(200);
    assert(ctl.sessions_started() == 2);
    assert(ctl.has_active_session());

    // Press again: recording is dropped and the loop ends
    ctl.on_activate();
    assert(h.wait_idle());
    h.settle(100);
    assert(ctl.sessions_started() == 2);
    assert(h.result_count() == 1);
    assert(h.backend().calls() == 1);
    assert(h.max_active() == 1);

    std::cout << "  PASS" << std::endl;
}

void test_continuous_stop_finalizes() {
    std::cout << "Testing continuous stop..." << std::endl;

    Harness h(RecordingMode::Continuous);
    auto& ctl = h.controller();

    ctl.on_activate();
    assert(h.wait_started(1));
    h.settle();

    ctl.stop_continuous();
    assert(wait_until([&]() { return h.result_count() == 1; }));
    assert(h.wait_idle());
    h.settle(100);

    // Transcribed, not restarted
    assert(ctl.sessions_started() == 1);
    assert(h.backend().calls() == 1);

    std::cout << "  PASS" << std::endl;
}

void test_continuous_failure_keeps_looping() {
    std::cout << "Testing continuous loop after a failed transcription..." << std::endl;

    Harness h(RecordingMode::Continuous, true);
    auto& ctl = h.controller();
    h.backend().set_throw(true);
    h.audio().set_samples(1600, 8000);

    ctl.on_activate();
    assert(h.wait_started(1));
    h.settle(100);

    // The failed session still completes with empty text and the loop goes on
    h.audio().set_samples(1600, 0);
    assert(wait_until([&]() { return h.result_count() == 1; }));
    assert(h.result(0).empty());
    assert(h.wait_started(2));

    // Release is ignored in continuous mode
    ctl.on_deactivate();
    h.settle();
    assert(ctl.has_active_session());

    ctl.cancel_session();
    assert(h.wait_idle());
    h.settle(100);
    assert(ctl.sessions_started() == 2);
    assert(h.result_count() == 1);

    std::cout << "  PASS" << std::endl;
}

void test_continuous_capture_failure_ends_loop() {
    std::cout << "Testing continuous loop with no audio device..." << std::endl;

    Harness h(RecordingMode::Continuous);
    auto& ctl = h.controller();
    h.audio().set_fail_start(true);

    ctl.on_activate();
    assert(h.wait_started(1));
    assert(h.wait_idle());
    h.settle(300);

    // One attempt, no restart and nothing delivered
    assert(ctl.sessions_started() == 1);
    assert(!ctl.has_active_session());
    assert(h.result_count() == 0);
    assert(h.backend().calls() == 0);

    // Once the device is back, the next press records normally
    h.audio().set_fail_start(false);
    ctl.on_activate();
    assert(h.wait_started(2));
    h.settle();
    ctl.stop_continuous();
    assert(wait_until([&]() { return h.result_count() == 1; }));
    assert(h.wait_idle());
    assert(h.result(0) == "Hello world. ");

    std::cout << "  PASS" << std::endl;
}

void test_activate_while_transcribing() {
    std::cout << "Testing activation during transcription..." << std::endl;

    Harness h(RecordingMode::PressToToggle);
    auto& ctl = h.controller();
    h.backend().set_delay_ms(200);

    ctl.on_activate();
    assert(h.wait_started(1));
    h.settle();
    ctl.on_activate();  // stop, transcription takes 200ms

    h.settle(50);
    ctl.on_activate();  // ignored while transcribing
    ctl.cancel_session();  // too late to cancel

    assert(wait_until([&]() { return h.result_count() == 1; }));
    assert(h.wait_idle());
    h.settle(100);
    assert(ctl.sessions_started() == 1);
    assert(h.max_active() == 1);

    std::cout << "  PASS" << std::endl;
}

void test_shutdown_cancels_recording() {
    std::cout << "Testing shutdown while recording..." << std::endl;

    auto h = std::make_unique<Harness>(RecordingMode::PressToToggle);
    h->controller().on_activate();
    assert(h->wait_started(1));
    h->settle();

    h->controller().shutdown();
    assert(!h->controller().is_running());
    assert(!h->controller().has_active_session());
    assert(h->result_count() == 0);
    assert(h->active() == 0);

    // Events after shutdown are dropped
    h->controller().on_activate();
    h.reset();

    std::cout << "  PASS" << std::endl;
}

void test_random_interleaving() {
    std::cout << "Testing random event interleaving..." << std::endl;

    const RecordingMode modes[] = {
        RecordingMode::PressToToggle,
        RecordingMode::HoldToRecord,
        RecordingMode::Continuous
    };

    std::mt19937 rng(42);
    for (RecordingMode mode : modes) {
        Harness h(mode);
        auto& ctl = h.controller();
        h.backend().set_delay_ms(5);

        for (int i = 0; i < 150; ++i) {
            switch (rng() % 4) {
                case 0:
                case 1: ctl.on_activate(); break;
                case 2: ctl.on_deactivate(); break;
                case 3: ctl.cancel_session(); break;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(rng() % 8));
            assert(h.active() <= 1);
        }

        ctl.cancel_session();
        ctl.stop_continuous();
        assert(h.wait_idle());
        assert(h.max_active() <= 1);
        assert(h.result_count() <= ctl.sessions_started());
    }

    std::cout << "  PASS" << std::endl;
}

int main() {
    std::cout << "\n=== Activation Controller Test Suite ===" << std::endl << std::endl;

    test_press_to_toggle();
    test_hold_to_record();
    test_cancel_session();
    test_continuous_restarts_until_activated();
    test_continuous_stop_finalizes();
    test_continuous_failure_keeps_looping();
    test_continuous_capture_failure_ends_loop();
    test_activate_while_transcribing();
    test_shutdown_cancels_recording();
    test_random_interleaving();

    std::cout << "\n=== All Tests Passed! ===" << std::endl << std::endl;
    return 0;
}
