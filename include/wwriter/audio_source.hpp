#pragma once

#include "audio_buffer.hpp"

namespace wwriter {

// Producer of captured samples for a recording session
class AudioSource {
public:
    virtual ~AudioSource() = default;

    virtual bool start() = 0;
    virtual void stop() = 0;

    // Samples captured since the previous call (drains the pending buffer)
    virtual AudioBuffer read_available_samples() = 0;
};

} // namespace wwriter
