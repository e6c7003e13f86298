#pragma once

#include "audio_source.hpp"
#include <atomic>
#include <mutex>
#include <string>
#include <portaudio.h>

namespace wwriter {

// PortAudio microphone capture, 16-bit mono. A stream is opened for every
// start() and closed again on stop().
class AudioCapture : public AudioSource {
public:
    // device < 0 selects the default input device
    explicit AudioCapture(int sample_rate = 16000, int device = -1, int frames_per_buffer = 512);
    ~AudioCapture() override;

    // Initialize PortAudio and resolve the input device
    bool initialize();
    void shutdown();

    bool start() override;
    void stop() override;
    bool is_recording() const { return recording_.load(); }

    AudioBuffer read_available_samples() override;

    const std::string& device_name() const { return device_name_; }

private:
    static int pa_callback(const void* input, void* output,
                           unsigned long frame_count,
                           const PaStreamCallbackTimeInfo* time_info,
                           PaStreamCallbackFlags status_flags,
                           void* user_data);

    void close_stream();

    int sample_rate_;
    int requested_device_;
    int frames_per_buffer_;

    PaDeviceIndex device_ = paNoDevice;
    std::string device_name_;
    PaTime latency_ = 0;

    PaStream* stream_ = nullptr;
    std::atomic<bool> recording_{false};
    std::atomic<bool> initialized_{false};

    AudioBuffer pending_;
    std::mutex buffer_mutex_;
};

} // namespace wwriter
