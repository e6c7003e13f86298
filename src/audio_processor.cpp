#include "wwriter/audio_processor.hpp"
#include <algorithm>
#include <cmath>

namespace wwriter {

std::vector<float> AudioProcessor::calculate_energy(const std::vector<float>& audio,
                                                    int window_size,
                                                    int hop_size) {
    if (audio.empty() || window_size <= 0 || hop_size <= 0) return {};

    std::vector<float> rms;
    for (size_t pos = 0; pos + window_size <= audio.size(); pos += hop_size) {
        double sum_sq = 0.0;
        for (size_t i = pos; i < pos + window_size; ++i) {
            sum_sq += static_cast<double>(audio[i]) * audio[i];
        }
        rms.push_back(static_cast<float>(std::sqrt(sum_sq / window_size)));
    }

    // 5-window moving average
    if (rms.size() <= 3) return rms;

    std::vector<float> smoothed(rms.size());
    const size_t n = rms.size();
    for (size_t i = 0; i < n; ++i) {
        size_t lo = i >= 2 ? i - 2 : 0;
        size_t hi = std::min(n - 1, i + 2);
        float sum = 0.0f;
        for (size_t j = lo; j <= hi; ++j) sum += rms[j];
        smoothed[i] = sum / static_cast<float>(hi - lo + 1);
    }
    return smoothed;
}

std::vector<SpeechSegment> AudioProcessor::find_speech_segments(const std::vector<float>& energy,
                                                                float threshold,
                                                                size_t min_frames,
                                                                size_t padding_frames) {
    std::vector<SpeechSegment> raw;

    // Speech opens after 2 loud frames and closes after 3 quiet ones
    bool open = false;
    size_t begin = 0;
    int loud = 0;
    int quiet = 0;
    for (size_t i = 0; i < energy.size(); ++i) {
        if (energy[i] > threshold) {
            quiet = 0;
            if (!open && ++loud >= 2) {
                open = true;
                begin = i > 1 ? i - 1 : 0;
            }
            continue;
        }

        ++quiet;
        if (!open) {
            loud = 0;
        } else if (quiet >= 3) {
            open = false;
            loud = 0;
            if (i - begin >= min_frames) raw.push_back({begin, i});
        }
    }
    if (open && energy.size() - begin >= min_frames) {
        raw.push_back({begin, energy.size()});
    }

    // Pad, then merge segments that touch
    std::vector<SpeechSegment> merged;
    for (const auto& seg : raw) {
        SpeechSegment padded{seg.begin > padding_frames ? seg.begin - padding_frames : 0,
                             std::min(seg.end + padding_frames, energy.size())};
        if (!merged.empty() && padded.begin <= merged.back().end) {
            merged.back().end = padded.end;
        } else {
            merged.push_back(padded);
        }
    }
    return merged;
}

std::vector<float> AudioProcessor::extract_speech(const std::vector<float>& audio,
                                                  float threshold,
                                                  int min_speech_ms,
                                                  int padding_ms,
                                                  int sample_rate) {
    const int window_size = sample_rate / 100;  // 10ms
    const int hop_size = sample_rate / 200;     // 5ms
    if (audio.empty() || hop_size <= 0) return audio;

    std::vector<float> energy = calculate_energy(audio, window_size, hop_size);
    const size_t frames_per_second = static_cast<size_t>(sample_rate / hop_size);
    std::vector<SpeechSegment> segments = find_speech_segments(
        energy, threshold,
        static_cast<size_t>(min_speech_ms) * frames_per_second / 1000,
        static_cast<size_t>(padding_ms) * frames_per_second / 1000);

    std::vector<float> speech;
    for (const auto& seg : segments) {
        size_t from = seg.begin * hop_size;
        size_t to = std::min(seg.end * hop_size + window_size, audio.size());
        speech.insert(speech.end(), audio.begin() + from, audio.begin() + to);
    }

    // No speech found: let the model see everything
    return speech.empty() ? audio : speech;
}

SilenceDetector::SilenceDetector(int sample_rate, int silence_duration_ms, float threshold)
    : window_size_(std::max(1, sample_rate / 100))  // 10ms windows
    , silence_samples_needed_(static_cast<int64_t>(silence_duration_ms) * sample_rate / 1000)
    , threshold_(threshold) {
}

void SilenceDetector::reset() {
    sum_sq_ = 0.0;
    window_fill_ = 0;
    consecutive_speech_ = 0;
    silent_samples_ = 0;
    speech_detected_ = false;
    triggered_ = false;
}

bool SilenceDetector::process(const int16_t* samples, size_t count) {
    for (size_t i = 0; i < count && !triggered_; ++i) {
        double s = samples[i] / 32768.0;
        sum_sq_ += s * s;
        if (++window_fill_ == window_size_) {
            finish_window();
        }
    }
    return triggered_;
}

void SilenceDetector::finish_window() {
    float rms = static_cast<float>(std::sqrt(sum_sq_ / window_size_));
    sum_sq_ = 0.0;
    window_fill_ = 0;

    if (rms > threshold_) {
        // Two consecutive loud windows count as speech
        if (++consecutive_speech_ >= 2) {
            speech_detected_ = true;
        }
        silent_samples_ = 0;
        return;
    }

    consecutive_speech_ = 0;
    if (!speech_detected_) return;

    silent_samples_ += window_size_;
    if (silent_samples_ >= silence_samples_needed_) {
        triggered_ = true;
    }
}

} // namespace wwriter
