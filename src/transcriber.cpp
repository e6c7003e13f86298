#include "wwriter/transcriber.hpp"
#include "wwriter/whisper_backend.hpp"
#include "wwriter/api_backend.hpp"
#include <iostream>
#include <chrono>

namespace wwriter {

const char* backend_kind_name(BackendKind kind) {
    switch (kind) {
        case BackendKind::Local: return "local";
        case BackendKind::Api: return "api";
    }
    return "local";
}

TranscriptionEngine::TranscriptionEngine(std::unique_ptr<TranscriptionBackend> backend)
    : backend_(std::move(backend)) {
}

TranscriptionResult TranscriptionEngine::transcribe(AudioBuffer audio) {
    if (audio.empty()) {
        TranscriptionResult result;
        result.success = true;
        return result;
    }

    std::lock_guard<std::mutex> lock(mutex_);

    auto start_time = std::chrono::steady_clock::now();
    TranscriptionResult result = backend_->transcribe(audio);
    auto end_time = std::chrono::steady_clock::now();

    result.duration_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        end_time - start_time).count();

    if (result.success) {
        std::cout << "Transcription [" << backend_kind_name(backend_->kind()) << "] took "
                  << result.duration_ms << "ms: \"" << result.text << "\"" << std::endl;
    }

    return result;
}

std::unique_ptr<TranscriptionBackend> create_backend(const Config& config) {
    const auto& model = config.model_options;
    int sample_rate = config.recording_options.sample_rate;

    if (model.use_api) {
        return std::make_unique<ApiBackend>(model.api, model.common, sample_rate);
    }

    auto backend = std::make_unique<WhisperBackend>(model.local, model.common, sample_rate);
    if (!backend->initialize()) {
        std::cerr << "Local model unavailable: " << model.local.resolved_model_path() << std::endl;
    }
    return backend;
}

} // namespace wwriter
