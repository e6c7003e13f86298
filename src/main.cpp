#include "wwriter/app.hpp"
#include "wwriter/config.hpp"
#include "wwriter/config_loader.hpp"
#include <iostream>
#include <csignal>
#include <cstring>
#include <cstdlib>

static wwriter::App* g_app = nullptr;

void signal_handler(int signum) {
    if (!g_app) return;
    if (signum == SIGUSR1) {
        g_app->request_cancel();
    } else {
        g_app->quit();
    }
}

void print_usage(const char* program) {
    std::cout << "Usage: " << program << " [options]\n"
              << "\nOptions:\n"
              << "  -c, --config PATH   Configuration file (default: ~/.wwriter/config.ini)\n"
              << "  -r, --mode MODE     Recording mode: press_to_toggle, hold_to_record, continuous\n"
              << "  -m, --model NAME    Local whisper model name (default: base.en)\n"
              << "  -l, --language LANG Language code, empty for auto-detect\n"
              << "  -k, --keycode N     Hotkey evdev keycode (default: Right Alt)\n"
              << "  --api               Transcribe with the remote API instead of the local model\n"
              << "  -h, --help          Show this help\n"
              << "\nRecording modes:\n"
              << "  press_to_toggle - press to start, press again to transcribe\n"
              << "  hold_to_record  - hold to record, release to transcribe\n"
              << "  continuous      - press to start, transcribes after each pause, press again to stop\n"
              << "\nSignals:\n"
              << "  SIGUSR1 cancels the current recording\n"
              << "\nFirst run:\n"
              << "  Download a model: curl -L -o models/ggml-base.en.bin \\\n"
              << "    https://huggingface.co/ggerganov/whisper.cpp/resolve/main/ggml-base.en.bin\n"
              << std::endl;
}

int main(int argc, char* argv[]) {
    std::string config_path;
    std::string mode_override;
    std::string model_override;
    std::string language_override;
    bool language_set = false;
    long keycode_override = -1;
    bool use_api = false;

    // Parse arguments
    for (int i = 1; i < argc; ++i) {
        if (strcmp(argv[i], "-h") == 0 || strcmp(argv[i], "--help") == 0) {
            print_usage(argv[0]);
            return 0;
        }
        else if ((strcmp(argv[i], "-c") == 0 || strcmp(argv[i], "--config") == 0) && i + 1 < argc) {
            config_path = argv[++i];
        }
        else if ((strcmp(argv[i], "-r") == 0 || strcmp(argv[i], "--mode") == 0) && i + 1 < argc) {
            mode_override = argv[++i];
        }
        else if ((strcmp(argv[i], "-m") == 0 || strcmp(argv[i], "--model") == 0) && i + 1 < argc) {
            model_override = argv[++i];
        }
        else if ((strcmp(argv[i], "-l") == 0 || strcmp(argv[i], "--language") == 0) && i + 1 < argc) {
            language_override = argv[++i];
            language_set = true;
        }
        else if ((strcmp(argv[i], "-k") == 0 || strcmp(argv[i], "--keycode") == 0) && i + 1 < argc) {
            keycode_override = std::atol(argv[++i]);
        }
        else if (strcmp(argv[i], "--api") == 0) {
            use_api = true;
        }
        else {
            std::cerr << "Unknown option: " << argv[i] << std::endl;
            print_usage(argv[0]);
            return 1;
        }
    }

    // Configuration errors are fatal before anything starts
    wwriter::ConfigLoadResult loaded;
    if (config_path.empty()) {
        if (!wwriter::ConfigLoader::create_default_config_file()) {
            std::cerr << "Could not create default config file, using built-in defaults" << std::endl;
        }
        loaded = wwriter::ConfigLoader::load_user_config();
    } else {
        loaded = wwriter::ConfigLoader::load_from_file(config_path);
    }
    if (!loaded.success) {
        std::cerr << "Configuration error: " << loaded.error << std::endl;
        return 1;
    }

    wwriter::Config config = loaded.config;
    std::string error;
    if (!mode_override.empty() &&
        !wwriter::ConfigLoader::apply_option(config, "recording_options.recording_mode", mode_override, error)) {
        std::cerr << "Configuration error: " << error << std::endl;
        return 1;
    }
    if (!model_override.empty()) {
        config.model_options.local.model = model_override;
        config.model_options.local.model_path.clear();
    }
    if (language_set) {
        config.model_options.common.language = language_override;
    }
    if (keycode_override >= 0) {
        config.recording_options.activation_key = static_cast<uint32_t>(keycode_override);
    }
    if (use_api) {
        config.model_options.use_api = true;
    }
    if (!wwriter::ConfigLoader::validate(config, error)) {
        std::cerr << "Configuration error: " << error << std::endl;
        return 1;
    }

    // Setup signal handlers
    signal(SIGINT, signal_handler);
    signal(SIGTERM, signal_handler);
    signal(SIGUSR1, signal_handler);

    // Create and initialize app
    wwriter::App app;
    g_app = &app;

    const auto& model = config.model_options;
    std::cout << "wwriter - voice dictation\n" << std::endl;
    std::cout << "Mode: " << wwriter::recording_mode_name(config.recording_options.recording_mode) << std::endl;
    if (model.use_api) {
        std::cout << "Backend: API (" << model.api.base_url << ", " << model.api.model << ")" << std::endl;
    } else {
        std::cout << "Backend: local (" << model.local.resolved_model_path() << ")" << std::endl;
    }
    std::cout << "Language: " << (model.common.language.empty() ? "auto" : model.common.language) << std::endl;
    std::cout << std::endl;

    if (!app.initialize(config)) {
        std::cerr << "Failed to initialize application" << std::endl;
        g_app = nullptr;
        return 1;
    }

    int result = app.run();

    app.shutdown();
    g_app = nullptr;
    return result;
}
