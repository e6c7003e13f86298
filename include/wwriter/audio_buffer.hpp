#pragma once

#include <vector>
#include <cstdint>

namespace wwriter {

// 16-bit mono PCM samples captured during one session
using AudioBuffer = std::vector<int16_t>;

// Rescale to [-1.0, 1.0) as sample / 32768
std::vector<float> to_float_samples(const AudioBuffer& samples);

// Uncompressed RIFF/WAVE (PCM, 16-bit, mono)
std::vector<uint8_t> encode_wav(const AudioBuffer& samples, int sample_rate);

// Duration in milliseconds at the given rate
int64_t buffer_duration_ms(const AudioBuffer& samples, int sample_rate);

} // namespace wwriter
