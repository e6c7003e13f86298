#include "wwriter/audio_buffer.hpp"

namespace wwriter {

namespace {

constexpr uint16_t NUM_CHANNELS = 1;
constexpr uint16_t BITS_PER_SAMPLE = 16;

// WAV is little-endian regardless of host
void put_u16(std::vector<uint8_t>& out, uint16_t v) {
    out.push_back(static_cast<uint8_t>(v & 0xff));
    out.push_back(static_cast<uint8_t>((v >> 8) & 0xff));
}

void put_u32(std::vector<uint8_t>& out, uint32_t v) {
    for (int i = 0; i < 4; ++i) {
        out.push_back(static_cast<uint8_t>((v >> (8 * i)) & 0xff));
    }
}

void put_tag(std::vector<uint8_t>& out, const char* tag) {
    out.insert(out.end(), tag, tag + 4);
}

} // namespace

std::vector<float> to_float_samples(const AudioBuffer& samples) {
    std::vector<float> out;
    out.reserve(samples.size());
    for (int16_t s : samples) {
        out.push_back(static_cast<float>(s) / 32768.0f);
    }
    return out;
}

std::vector<uint8_t> encode_wav(const AudioBuffer& samples, int sample_rate) {
    uint32_t data_size = static_cast<uint32_t>(samples.size() * sizeof(int16_t));
    uint16_t block_align = NUM_CHANNELS * BITS_PER_SAMPLE / 8;
    uint32_t byte_rate = static_cast<uint32_t>(sample_rate) * block_align;

    std::vector<uint8_t> out;
    out.reserve(44 + data_size);

    // RIFF header
    put_tag(out, "RIFF");
    put_u32(out, 36 + data_size);
    put_tag(out, "WAVE");

    // fmt chunk
    put_tag(out, "fmt ");
    put_u32(out, 16);
    put_u16(out, 1);  // PCM
    put_u16(out, NUM_CHANNELS);
    put_u32(out, static_cast<uint32_t>(sample_rate));
    put_u32(out, byte_rate);
    put_u16(out, block_align);
    put_u16(out, BITS_PER_SAMPLE);

    // data chunk
    put_tag(out, "data");
    put_u32(out, data_size);
    for (int16_t s : samples) {
        put_u16(out, static_cast<uint16_t>(s));
    }

    return out;
}

int64_t buffer_duration_ms(const AudioBuffer& samples, int sample_rate) {
    if (sample_rate <= 0) return 0;
    return static_cast<int64_t>(samples.size()) * 1000 / sample_rate;
}

} // namespace wwriter
