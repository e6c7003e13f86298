#pragma once

#include "transcriber.hpp"
#include <memory>
#include <mutex>
#include <string>

// Forward declare whisper types
struct whisper_context;

namespace wwriter {

// Loaded whisper.cpp model. Instances are cached process-wide and shared.
class WhisperModel {
public:
    ~WhisperModel();

    WhisperModel(const WhisperModel&) = delete;
    WhisperModel& operator=(const WhisperModel&) = delete;

    // Load (or reuse) the model for these options. Falls back to CPU when
    // GPU initialization fails; nullptr only if the CPU load fails too.
    static std::shared_ptr<WhisperModel> acquire(const LocalModelOptions& options);

    whisper_context* context() const { return ctx_; }
    const std::string& path() const { return path_; }
    bool uses_gpu() const { return use_gpu_; }

    // whisper_context is not reentrant
    std::mutex& mutex() { return mutex_; }

private:
    WhisperModel(whisper_context* ctx, std::string path, bool use_gpu);

    static whisper_context* load(const std::string& path, bool use_gpu);

    whisper_context* ctx_ = nullptr;
    std::string path_;
    bool use_gpu_ = false;
    std::mutex mutex_;
};

class WhisperBackend : public TranscriptionBackend {
public:
    WhisperBackend(const LocalModelOptions& local, const CommonModelOptions& common, int sample_rate);

    // Load the model; false when neither the requested device nor CPU works
    bool initialize();

    BackendKind kind() const override { return BackendKind::Local; }
    bool is_ready() const override { return model_ != nullptr; }

    TranscriptionResult transcribe(const AudioBuffer& audio) override;

private:
    LocalModelOptions local_;
    CommonModelOptions common_;
    int sample_rate_;
    std::shared_ptr<WhisperModel> model_;
};

} // namespace wwriter
