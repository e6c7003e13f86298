#pragma once

namespace wwriter {

// Short beep on the default output device (blocking, ~150ms)
bool play_completion_sound(int sample_rate = 44100);

} // namespace wwriter
