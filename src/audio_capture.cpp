#include "wwriter/audio_capture.hpp"
#include <iostream>

namespace wwriter {

AudioCapture::AudioCapture(int sample_rate, int device, int frames_per_buffer)
    : sample_rate_(sample_rate)
    , requested_device_(device)
    , frames_per_buffer_(frames_per_buffer) {
}

AudioCapture::~AudioCapture() {
    shutdown();
}

bool AudioCapture::initialize() {
    if (initialized_.load()) return true;

    PaError err = Pa_Initialize();
    if (err != paNoError) {
        std::cerr << "PortAudio init failed: " << Pa_GetErrorText(err) << std::endl;
        return false;
    }

    if (requested_device_ < 0) {
        device_ = Pa_GetDefaultInputDevice();
    } else if (requested_device_ < Pa_GetDeviceCount()) {
        device_ = static_cast<PaDeviceIndex>(requested_device_);
    } else {
        std::cerr << "Sound device " << requested_device_ << " does not exist ("
                  << Pa_GetDeviceCount() << " devices)" << std::endl;
        Pa_Terminate();
        return false;
    }

    const PaDeviceInfo* info = device_ == paNoDevice ? nullptr : Pa_GetDeviceInfo(device_);
    if (!info || info->maxInputChannels < 1) {
        std::cerr << "No usable input device" << std::endl;
        Pa_Terminate();
        return false;
    }

    device_name_ = info->name ? info->name : "unknown";
    latency_ = info->defaultLowInputLatency;

    // Fail at startup rather than on the first recording
    PaStreamParameters params{device_, 1, paInt16, latency_, nullptr};
    err = Pa_IsFormatSupported(&params, nullptr, sample_rate_);
    if (err != paFormatIsSupported) {
        std::cerr << "Input device '" << device_name_ << "' cannot record at " << sample_rate_
                  << "Hz: " << Pa_GetErrorText(err) << std::endl;
        Pa_Terminate();
        return false;
    }

    std::cout << "Using input device: " << device_name_ << std::endl;
    initialized_.store(true);
    return true;
}

void AudioCapture::shutdown() {
    if (!initialized_.load()) return;

    stop();
    Pa_Terminate();
    initialized_.store(false);
}

bool AudioCapture::start() {
    if (!initialized_.load() || recording_.load()) return false;

    {
        std::lock_guard<std::mutex> lock(buffer_mutex_);
        pending_.clear();
    }

    PaStreamParameters params{device_, 1, paInt16, latency_, nullptr};
    PaError err = Pa_OpenStream(&stream_, &params, nullptr, sample_rate_,
                                frames_per_buffer_, paClipOff, pa_callback, this);
    if (err != paNoError) {
        std::cerr << "Failed to open stream: " << Pa_GetErrorText(err) << std::endl;
        stream_ = nullptr;
        return false;
    }

    recording_.store(true);
    err = Pa_StartStream(stream_);
    if (err != paNoError) {
        std::cerr << "Failed to start stream: " << Pa_GetErrorText(err) << std::endl;
        recording_.store(false);
        close_stream();
        return false;
    }

    return true;
}

void AudioCapture::stop() {
    if (!recording_.exchange(false)) return;

    // Pa_StopStream waits for pending buffers, so the last callback has run
    PaError err = Pa_StopStream(stream_);
    if (err != paNoError) {
        std::cerr << "Failed to stop stream: " << Pa_GetErrorText(err) << std::endl;
    }
    close_stream();
}

void AudioCapture::close_stream() {
    if (!stream_) return;

    PaError err = Pa_CloseStream(stream_);
    if (err != paNoError) {
        std::cerr << "Failed to close stream: " << Pa_GetErrorText(err) << std::endl;
    }
    stream_ = nullptr;
}

AudioBuffer AudioCapture::read_available_samples() {
    AudioBuffer out;
    std::lock_guard<std::mutex> lock(buffer_mutex_);
    out.swap(pending_);
    return out;
}

int AudioCapture::pa_callback(const void* input, void* output,
                              unsigned long frame_count,
                              const PaStreamCallbackTimeInfo* time_info,
                              PaStreamCallbackFlags status_flags,
                              void* user_data) {
    (void)output;
    (void)time_info;
    (void)status_flags;

    auto* capture = static_cast<AudioCapture*>(user_data);
    if (!input) return paContinue;

    const int16_t* in = static_cast<const int16_t*>(input);
    std::lock_guard<std::mutex> lock(capture->buffer_mutex_);
    capture->pending_.insert(capture->pending_.end(), in, in + frame_count);

    return paContinue;
}

} // namespace wwriter
