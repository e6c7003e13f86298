#pragma once

#include "audio_buffer.hpp"
#include "config.hpp"
#include <string>
#include <memory>
#include <mutex>
#include <cstdint>

namespace wwriter {

struct TranscriptionResult {
    std::string text;
    int64_t duration_ms = 0;
    bool success = false;
    std::string error;
};

enum class BackendKind {
    Local,  // whisper.cpp
    Api     // OpenAI-compatible HTTP endpoint
};

const char* backend_kind_name(BackendKind kind);

// One speech recognition implementation
class TranscriptionBackend {
public:
    virtual ~TranscriptionBackend() = default;

    virtual BackendKind kind() const = 0;

    // False if setup failed; transcribe() then reports an error
    virtual bool is_ready() const = 0;

    // Audio is 16-bit mono at the configured sample rate, never empty
    virtual TranscriptionResult transcribe(const AudioBuffer& audio) = 0;
};

// Routes every buffer to the single backend chosen at construction
class TranscriptionEngine {
public:
    explicit TranscriptionEngine(std::unique_ptr<TranscriptionBackend> backend);

    // Takes ownership of the buffer. Empty audio returns empty text without
    // touching the backend.
    TranscriptionResult transcribe(AudioBuffer audio);

    BackendKind backend_kind() const { return backend_->kind(); }
    bool is_ready() const { return backend_->is_ready(); }

private:
    std::unique_ptr<TranscriptionBackend> backend_;
    std::mutex mutex_;  // one inference at a time
};

// Local or API backend according to model_options.use_api
std::unique_ptr<TranscriptionBackend> create_backend(const Config& config);

} // namespace wwriter
