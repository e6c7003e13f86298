#pragma once

#include <string>
#include <cstdint>

namespace wwriter {

// How hotkey press/release events map to session start/stop/cancel
enum class RecordingMode {
    PressToToggle,  // press starts, next press stops and transcribes
    HoldToRecord,   // press starts, release stops and transcribes
    Continuous      // press starts a loop that re-records after every transcription
};

// Parse "press_to_toggle" / "hold_to_record" / "continuous"
bool parse_recording_mode(const std::string& text, RecordingMode& mode);
const char* recording_mode_name(RecordingMode mode);

struct RecordingOptions {
    RecordingMode recording_mode = RecordingMode::PressToToggle;
    int sample_rate = 16000;        // Whisper expects 16kHz
    int sound_device = -1;          // PortAudio device index, -1 = default input
    uint32_t activation_key = 0;    // evdev keycode, 0 = Right Alt
    int silence_duration = 900;     // ms of trailing silence that ends a continuous session
    int min_duration = 100;         // ms, shorter recordings are discarded
};

struct LocalModelOptions {
    std::string model = "base.en";  // Named model, resolved inside model_dir
    std::string model_path;         // Explicit model file, overrides model
    std::string model_dir = "models";
    std::string compute_type = "default";  // default, float16, float32, int8
    std::string device = "auto";           // auto, cuda, cpu
    bool condition_on_previous_text = true;
    bool vad_filter = false;
    int n_threads = 4;

    // Full model path (model_path wins over model)
    std::string resolved_model_path() const {
        if (!model_path.empty()) return model_path;
        return model_dir + "/ggml-" + model + ".bin";
    }
};

struct ApiOptions {
    std::string base_url = "https://api.openai.com/v1";
    std::string model = "whisper-1";
    std::string api_key;            // Falls back to OPENAI_API_KEY
};

// Shared by both backends
struct CommonModelOptions {
    std::string language;           // Empty = auto-detect
    std::string initial_prompt;
    float temperature = 0.0f;
};

struct ModelOptions {
    bool use_api = false;
    LocalModelOptions local;
    ApiOptions api;
    CommonModelOptions common;
};

struct PostProcessingConfig {
    bool remove_trailing_period = false;
    bool add_trailing_space = true;
    bool remove_capitalization = false;
    int paste_delay_ms = 100;       // Wait between clipboard set and Ctrl+V
};

struct MiscOptions {
    bool hide_status_window = false;
    bool noise_on_completion = false;
};

struct Config {
    RecordingOptions recording_options;
    ModelOptions model_options;
    PostProcessingConfig post_processing;
    MiscOptions misc;
};

// Default hotkey (Right Alt)
constexpr uint32_t DEFAULT_HOTKEY = 100;

} // namespace wwriter
