#pragma once

#include <vector>
#include <cstddef>
#include <cstdint>

namespace wwriter {

// Half-open range of energy frames
struct SpeechSegment {
    size_t begin;
    size_t end;
};

// Energy-based voice activity helpers
class AudioProcessor {
public:
    // Smoothed RMS energy per window
    static std::vector<float> calculate_energy(const std::vector<float>& audio,
                                               int window_size,
                                               int hop_size);

    // Speech ranges in an energy curve, padded and merged
    static std::vector<SpeechSegment> find_speech_segments(const std::vector<float>& energy,
                                                           float threshold,
                                                           size_t min_frames,
                                                           size_t padding_frames);

    // Keep only speech segments (plus padding). Returns the input if no speech is found.
    static std::vector<float> extract_speech(const std::vector<float>& audio,
                                             float threshold,
                                             int min_speech_ms,
                                             int padding_ms,
                                             int sample_rate);
};

// Incremental detector for "speech, then silence_duration_ms of silence".
// Used to end continuous-mode recordings.
class SilenceDetector {
public:
    SilenceDetector(int sample_rate, int silence_duration_ms, float threshold = 0.01f);

    // Feed captured samples. Returns true once trailing silence follows speech.
    bool process(const int16_t* samples, size_t count);
    bool process(const std::vector<int16_t>& samples) {
        return process(samples.data(), samples.size());
    }

    bool speech_detected() const { return speech_detected_; }
    bool triggered() const { return triggered_; }
    void reset();

private:
    void finish_window();

    int window_size_;
    int64_t silence_samples_needed_;
    float threshold_;

    double sum_sq_ = 0.0;
    int window_fill_ = 0;
    int consecutive_speech_ = 0;
    int64_t silent_samples_ = 0;
    bool speech_detected_ = false;
    bool triggered_ = false;
};

} // namespace wwriter
