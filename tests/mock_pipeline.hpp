#pragma once

// Test doubles for the audio source and transcription backend

#include "wwriter/audio_source.hpp"
#include "wwriter/transcriber.hpp"

#include <atomic>
#include <chrono>
#include <functional>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>

namespace wwriter {
namespace testing {

// Hands out a fixed chunk of samples on every read while started
class MockAudioSource : public AudioSource {
public:
    explicit MockAudioSource(size_t samples_per_read = 1600, int16_t value = 1000)
        : samples_per_read_(samples_per_read), value_(value) {}

    bool start() override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (fail_start_) return false;
        running_ = true;
        starts_++;
        return true;
    }

    void stop() override {
        std::lock_guard<std::mutex> lock(mutex_);
        running_ = false;
        stops_++;
    }

    AudioBuffer read_available_samples() override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!running_) return {};
        return AudioBuffer(samples_per_read_, value_);
    }

    void set_samples(size_t samples_per_read, int16_t value) {
        std::lock_guard<std::mutex> lock(mutex_);
        samples_per_read_ = samples_per_read;
        value_ = value;
    }

    void set_fail_start(bool fail) {
        std::lock_guard<std::mutex> lock(mutex_);
        fail_start_ = fail;
    }

    int starts() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return starts_;
    }

    int stops() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return stops_;
    }

private:
    mutable std::mutex mutex_;
    size_t samples_per_read_;
    int16_t value_;
    bool running_ = false;
    bool fail_start_ = false;
    int starts_ = 0;
    int stops_ = 0;
};

// Returns a configurable transcript and counts calls
class MockBackend : public TranscriptionBackend {
public:
    explicit MockBackend(std::string text = "Hello world.") : text_(std::move(text)) {}

    BackendKind kind() const override { return BackendKind::Local; }
    bool is_ready() const override { return true; }

    TranscriptionResult transcribe(const AudioBuffer& audio) override {
        calls_++;
        last_size_ = audio.size();
        if (delay_ms_ > 0) {
            std::this_thread::sleep_for(std::chrono::milliseconds(delay_ms_.load()));
        }
        if (throw_.load()) {
            throw std::runtime_error("backend exploded");
        }

        TranscriptionResult result;
        std::lock_guard<std::mutex> lock(mutex_);
        if (fail_) {
            result.error = "model not loaded";
            return result;
        }
        result.text = text_;
        result.success = true;
        return result;
    }

    void set_text(const std::string& text) {
        std::lock_guard<std::mutex> lock(mutex_);
        text_ = text;
    }

    void set_fail(bool fail) {
        std::lock_guard<std::mutex> lock(mutex_);
        fail_ = fail;
    }

    void set_throw(bool value) { throw_.store(value); }
    void set_delay_ms(int ms) { delay_ms_.store(ms); }

    int calls() const { return calls_.load(); }
    size_t last_size() const { return last_size_.load(); }

private:
    std::mutex mutex_;
    std::string text_;
    bool fail_ = false;
    std::atomic<bool> throw_{false};
    std::atomic<int> delay_ms_{0};
    std::atomic<int> calls_{0};
    std::atomic<size_t> last_size_{0};
};

// Poll until pred() holds or timeout_ms passes
inline bool wait_until(const std::function<bool()>& pred, int timeout_ms = 3000) {
    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
    while (std::chrono::steady_clock::now() < deadline) {
        if (pred()) return true;
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    return pred();
}

} // namespace testing
} // namespace wwriter
