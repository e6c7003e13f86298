#include "wwriter/config_loader.hpp"
#include <iostream>
#include <fstream>
#include <sstream>
#include <algorithm>
#include <filesystem>
#include <cstdlib>
#include <cerrno>
#include <cctype>
#include <climits>

namespace wwriter {

bool parse_recording_mode(const std::string& text, RecordingMode& mode) {
    if (text == "press_to_toggle") {
        mode = RecordingMode::PressToToggle;
    } else if (text == "hold_to_record") {
        mode = RecordingMode::HoldToRecord;
    } else if (text == "continuous") {
        mode = RecordingMode::Continuous;
    } else {
        return false;
    }
    return true;
}

const char* recording_mode_name(RecordingMode mode) {
    switch (mode) {
        case RecordingMode::PressToToggle: return "press_to_toggle";
        case RecordingMode::HoldToRecord: return "hold_to_record";
        case RecordingMode::Continuous: return "continuous";
    }
    return "press_to_toggle";
}

namespace {

std::string trim(const std::string& s) {
    size_t start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    size_t end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

// Strip one pair of surrounding quotes
std::string unquote(const std::string& s) {
    if (s.size() >= 2 && (s.front() == '"' || s.front() == '\'') && s.back() == s.front()) {
        return s.substr(1, s.size() - 2);
    }
    return s;
}

bool parse_bool(const std::string& value, bool& out) {
    std::string lower = value;
    std::transform(lower.begin(), lower.end(), lower.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    if (lower == "true" || lower == "yes" || lower == "1" || lower == "on") {
        out = true;
        return true;
    }
    if (lower == "false" || lower == "no" || lower == "0" || lower == "off") {
        out = false;
        return true;
    }
    return false;
}

bool parse_int(const std::string& value, long& out) {
    if (value.empty()) return false;
    char* end = nullptr;
    errno = 0;
    out = std::strtol(value.c_str(), &end, 10);
    return errno == 0 && end && *end == '\0';
}

bool parse_float(const std::string& value, float& out) {
    if (value.empty()) return false;
    char* end = nullptr;
    errno = 0;
    out = std::strtof(value.c_str(), &end);
    return errno == 0 && end && *end == '\0';
}

bool set_bool(bool& field, const std::string& key, const std::string& value, std::string& error) {
    if (!parse_bool(value, field)) {
        error = "expected boolean for " + key + ", got '" + value + "'";
        return false;
    }
    return true;
}

bool set_int(int& field, const std::string& key, const std::string& value, std::string& error) {
    long parsed = 0;
    if (!parse_int(value, parsed)) {
        error = "expected integer for " + key + ", got '" + value + "'";
        return false;
    }
    if (parsed < INT_MIN || parsed > INT_MAX) {
        error = "value out of range for " + key + ": '" + value + "'";
        return false;
    }
    field = static_cast<int>(parsed);
    return true;
}

} // namespace

bool ConfigLoader::apply_option(Config& config, const std::string& key,
                                const std::string& value, std::string& error) {
    auto& rec = config.recording_options;
    auto& local = config.model_options.local;
    auto& api = config.model_options.api;
    auto& common = config.model_options.common;
    auto& post = config.post_processing;

    // recording_options
    if (key == "recording_options.recording_mode") {
        if (!parse_recording_mode(value, rec.recording_mode)) {
            error = "unknown recording_mode '" + value +
                    "' (expected press_to_toggle, hold_to_record or continuous)";
            return false;
        }
        return true;
    }
    if (key == "recording_options.sample_rate") return set_int(rec.sample_rate, key, value, error);
    if (key == "recording_options.sound_device") return set_int(rec.sound_device, key, value, error);
    if (key == "recording_options.activation_key") {
        long code = 0;
        if (!parse_int(value, code) || code < 0 || code > static_cast<long>(UINT32_MAX)) {
            error = "expected keycode for " + key + ", got '" + value + "'";
            return false;
        }
        rec.activation_key = static_cast<uint32_t>(code);
        return true;
    }
    if (key == "recording_options.silence_duration") return set_int(rec.silence_duration, key, value, error);
    if (key == "recording_options.min_duration") return set_int(rec.min_duration, key, value, error);

    // model_options
    if (key == "model_options.use_api") return set_bool(config.model_options.use_api, key, value, error);

    if (key == "model_options.local.model") { local.model = value; return true; }
    if (key == "model_options.local.model_path") { local.model_path = value; return true; }
    if (key == "model_options.local.model_dir") { local.model_dir = value; return true; }
    if (key == "model_options.local.compute_type") { local.compute_type = value; return true; }
    if (key == "model_options.local.device") { local.device = value; return true; }
    if (key == "model_options.local.condition_on_previous_text") {
        return set_bool(local.condition_on_previous_text, key, value, error);
    }
    if (key == "model_options.local.vad_filter") return set_bool(local.vad_filter, key, value, error);
    if (key == "model_options.local.n_threads") return set_int(local.n_threads, key, value, error);

    if (key == "model_options.api.base_url") { api.base_url = value; return true; }
    if (key == "model_options.api.model") { api.model = value; return true; }
    if (key == "model_options.api.api_key") { api.api_key = value; return true; }

    if (key == "model_options.common.language") { common.language = value; return true; }
    if (key == "model_options.common.initial_prompt") { common.initial_prompt = value; return true; }
    if (key == "model_options.common.temperature") {
        if (!parse_float(value, common.temperature)) {
            error = "expected number for " + key + ", got '" + value + "'";
            return false;
        }
        return true;
    }

    // post_processing
    if (key == "post_processing.remove_trailing_period") {
        return set_bool(post.remove_trailing_period, key, value, error);
    }
    if (key == "post_processing.add_trailing_space") return set_bool(post.add_trailing_space, key, value, error);
    if (key == "post_processing.remove_capitalization") {
        return set_bool(post.remove_capitalization, key, value, error);
    }
    if (key == "post_processing.paste_delay") return set_int(post.paste_delay_ms, key, value, error);

    // misc
    if (key == "misc.hide_status_window") return set_bool(config.misc.hide_status_window, key, value, error);
    if (key == "misc.noise_on_completion") return set_bool(config.misc.noise_on_completion, key, value, error);

    error = "unknown option '" + key + "'";
    return false;
}

bool ConfigLoader::validate(const Config& config, std::string& error) {
    const auto& rec = config.recording_options;
    const auto& local = config.model_options.local;

    if (rec.sample_rate < 8000 || rec.sample_rate > 48000) {
        error = "recording_options.sample_rate must be between 8000 and 48000";
        return false;
    }
    if (rec.sound_device < -1) {
        error = "recording_options.sound_device must be -1 (default) or a device index";
        return false;
    }
    if (rec.silence_duration <= 0) {
        error = "recording_options.silence_duration must be positive";
        return false;
    }
    if (rec.min_duration < 0) {
        error = "recording_options.min_duration must not be negative";
        return false;
    }
    if (config.model_options.common.temperature < 0.0f || config.model_options.common.temperature > 1.0f) {
        error = "model_options.common.temperature must be between 0.0 and 1.0";
        return false;
    }
    if (config.post_processing.paste_delay_ms < 0) {
        error = "post_processing.paste_delay must not be negative";
        return false;
    }

    if (config.model_options.use_api) {
        if (config.model_options.api.base_url.empty() || config.model_options.api.model.empty()) {
            error = "model_options.api.base_url and model_options.api.model are required when use_api is set";
            return false;
        }
    } else {
        if (local.model.empty() && local.model_path.empty()) {
            error = "model_options.local.model or model_options.local.model_path is required";
            return false;
        }
        if (local.compute_type != "default" && local.compute_type != "float16" &&
            local.compute_type != "float32" && local.compute_type != "int8") {
            error = "unknown model_options.local.compute_type '" + local.compute_type + "'";
            return false;
        }
        if (local.device != "auto" && local.device != "cuda" && local.device != "cpu") {
            error = "unknown model_options.local.device '" + local.device + "'";
            return false;
        }
        if (local.n_threads < 1) {
            error = "model_options.local.n_threads must be at least 1";
            return false;
        }
    }

    return true;
}

ConfigLoadResult ConfigLoader::parse(const std::string& text, const std::string& path) {
    ConfigLoadResult result;

    std::istringstream in(text);
    std::string section;
    std::string line;
    int line_no = 0;

    while (std::getline(in, line)) {
        ++line_no;
        line = trim(line);

        // Skip empty lines and comments
        if (line.empty() || line[0] == '#' || line[0] == ';') continue;

        // Section header: [model_options.local]
        if (line.front() == '[') {
            if (line.back() != ']') {
                result.error = path + ":" + std::to_string(line_no) + ": unterminated section header";
                return result;
            }
            section = trim(line.substr(1, line.size() - 2));
            continue;
        }

        size_t eq = line.find('=');
        if (eq == std::string::npos) {
            result.error = path + ":" + std::to_string(line_no) + ": expected 'key = value'";
            return result;
        }

        std::string key = trim(line.substr(0, eq));
        std::string value = unquote(trim(line.substr(eq + 1)));
        if (key.empty()) {
            result.error = path + ":" + std::to_string(line_no) + ": missing key";
            return result;
        }

        // Keys containing a dot are already fully qualified
        std::string full_key = (section.empty() || key.find('.') != std::string::npos)
                               ? key : section + "." + key;

        std::string error;
        if (!apply_option(result.config, full_key, value, error)) {
            result.error = path + ":" + std::to_string(line_no) + ": " + error;
            return result;
        }
    }

    std::string error;
    if (!validate(result.config, error)) {
        result.error = path + ": " + error;
        return result;
    }

    result.success = true;
    return result;
}

ConfigLoadResult ConfigLoader::load_from_file(const std::string& path, bool allow_missing) {
    ConfigLoadResult result;

    if (path.empty()) {
        result.error = "no configuration path";
        return result;
    }

    std::ifstream file(path);
    if (!file.is_open()) {
        if (allow_missing) {
            // File doesn't exist - that's OK, defaults apply
            result.success = validate(result.config, result.error);
            return result;
        }
        result.error = "cannot open configuration file: " + path;
        return result;
    }

    std::ostringstream contents;
    contents << file.rdbuf();
    result = parse(contents.str(), path);

    if (result.success) {
        std::cout << "Loaded configuration: " << path << std::endl;
    }
    return result;
}

std::string ConfigLoader::get_default_config_path() {
    const char* home = std::getenv("HOME");
    if (!home) return "";
    return std::string(home) + "/.wwriter/config.ini";
}

ConfigLoadResult ConfigLoader::load_user_config() {
    std::string path = get_default_config_path();
    if (path.empty()) {
        ConfigLoadResult result;
        result.success = validate(result.config, result.error);
        return result;
    }
    return load_from_file(path, true);
}

bool ConfigLoader::create_default_config_file() {
    std::string path = get_default_config_path();
    if (path.empty()) return false;

    // Create directory if needed
    std::filesystem::path dir = std::filesystem::path(path).parent_path();
    if (!std::filesystem::exists(dir)) {
        try {
            std::filesystem::create_directories(dir);
        } catch (const std::exception& e) {
            std::cerr << "Failed to create config directory: " << e.what() << std::endl;
            return false;
        }
    }

    // Don't overwrite existing file
    if (std::filesystem::exists(path)) {
        return true;
    }

    std::ofstream file(path);
    if (!file.is_open()) {
        std::cerr << "Failed to create config file: " << path << std::endl;
        return false;
    }

    file << R"(# wwriter configuration
# Lines are "key = value" inside [section] headers. Booleans: true/false.

[recording_options]
# press_to_toggle, hold_to_record or continuous
recording_mode = press_to_toggle
sample_rate = 16000
# PortAudio input device index, -1 uses the default device
sound_device = -1
# evdev keycode, 0 uses Right Alt
activation_key = 0
# continuous mode: ms of silence after speech that ends a recording
silence_duration = 900
# recordings shorter than this (ms) are discarded
min_duration = 100

[model_options]
use_api = false

[model_options.local]
model = base.en
# model_path = /path/to/ggml-base.en.bin
model_dir = models
# default, float16, float32, int8 (int8 forces CPU)
compute_type = default
# auto, cuda, cpu
device = auto
condition_on_previous_text = true
vad_filter = false
n_threads = 4

[model_options.api]
base_url = https://api.openai.com/v1
model = whisper-1
# api_key = sk-...   (or set OPENAI_API_KEY)

[model_options.common]
# empty = auto-detect
language =
initial_prompt =
temperature = 0.0

[post_processing]
remove_trailing_period = false
add_trailing_space = true
remove_capitalization = false
# ms between setting the clipboard and pasting
paste_delay = 100

[misc]
hide_status_window = false
noise_on_completion = false
)";

    std::cout << "Created config file: " << path << std::endl;
    return true;
}

} // namespace wwriter
