#include "wwriter/completion_sound.hpp"
#include <portaudio.h>
#include <iostream>
#include <vector>
#include <cmath>

#ifndef M_PI
#define M_PI 3.14159265358979323846
#endif

namespace wwriter {

static constexpr float BEEP_FREQ = 880.0f;
static constexpr float BEEP_SECONDS = 0.15f;
static constexpr float BEEP_AMPLITUDE = 0.3f;

bool play_completion_sound(int sample_rate) {
    PaError err = Pa_Initialize();
    if (err != paNoError) {
        std::cerr << "PortAudio init failed: " << Pa_GetErrorText(err) << std::endl;
        return false;
    }

    size_t n = static_cast<size_t>(sample_rate * BEEP_SECONDS);
    std::vector<float> tone(n);
    size_t fade = n / 10;
    for (size_t i = 0; i < n; ++i) {
        float env = 1.0f;
        if (i < fade) env = static_cast<float>(i) / fade;
        else if (i > n - fade) env = static_cast<float>(n - i) / fade;
        tone[i] = BEEP_AMPLITUDE * env *
                  std::sin(2.0f * static_cast<float>(M_PI) * BEEP_FREQ * i / sample_rate);
    }

    PaStream* stream = nullptr;
    err = Pa_OpenDefaultStream(&stream, 0, 1, paFloat32, sample_rate,
                               paFramesPerBufferUnspecified, nullptr, nullptr);
    if (err != paNoError) {
        std::cerr << "Failed to open output stream: " << Pa_GetErrorText(err) << std::endl;
        Pa_Terminate();
        return false;
    }

    bool ok = false;
    err = Pa_StartStream(stream);
    if (err == paNoError) {
        err = Pa_WriteStream(stream, tone.data(), static_cast<unsigned long>(tone.size()));
        ok = (err == paNoError || err == paOutputUnderflowed);
        Pa_StopStream(stream);
    }
    if (!ok) {
        std::cerr << "Failed to play completion sound: " << Pa_GetErrorText(err) << std::endl;
    }

    Pa_CloseStream(stream);
    Pa_Terminate();
    return ok;
}

} // namespace wwriter
