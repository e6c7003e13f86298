#include "wwriter/whisper_backend.hpp"
#include "wwriter/audio_processor.hpp"
#include "whisper.h"
#include <iostream>
#include <map>

namespace wwriter {

namespace {

// VAD tuning for vad_filter
constexpr float VAD_THRESHOLD = 0.015f;
constexpr int VAD_MIN_SPEECH_MS = 100;
constexpr int VAD_PADDING_MS = 200;

std::string cache_key(const LocalModelOptions& options) {
    return options.resolved_model_path() + "|" + options.device + "|" + options.compute_type;
}

} // namespace

WhisperModel::WhisperModel(whisper_context* ctx, std::string path, bool use_gpu)
    : ctx_(ctx)
    , path_(std::move(path))
    , use_gpu_(use_gpu) {
}

WhisperModel::~WhisperModel() {
    if (ctx_) {
        whisper_free(ctx_);
        ctx_ = nullptr;
    }
}

whisper_context* WhisperModel::load(const std::string& path, bool use_gpu) {
    struct whisper_context_params cparams = whisper_context_default_params();
    cparams.use_gpu = use_gpu;
    return whisper_init_from_file_with_params(path.c_str(), cparams);
}

std::shared_ptr<WhisperModel> WhisperModel::acquire(const LocalModelOptions& options) {
    static std::mutex cache_mutex;
    static std::map<std::string, std::shared_ptr<WhisperModel>> cache;

    std::lock_guard<std::mutex> lock(cache_mutex);

    const std::string key = cache_key(options);
    auto it = cache.find(key);
    if (it != cache.end()) return it->second;

    const std::string path = options.resolved_model_path();

    bool use_gpu = options.device != "cpu";
    if (options.compute_type == "int8") {
        std::cout << "Using int8 quantization, forcing CPU usage." << std::endl;
        use_gpu = false;
    }

    std::cout << "Loading whisper model: " << path << " (device: " << (use_gpu ? options.device : "cpu")
              << ", compute type: " << options.compute_type << ")" << std::endl;

    whisper_context* ctx = load(path, use_gpu);
    if (!ctx && use_gpu) {
        std::cerr << "Failed to initialize whisper model on " << options.device
                  << ", falling back to CPU." << std::endl;
        use_gpu = false;
        ctx = load(path, false);
    }

    if (!ctx) {
        std::cerr << "Failed to load whisper model: " << path << std::endl;
        return nullptr;
    }

    std::shared_ptr<WhisperModel> model(new WhisperModel(ctx, path, use_gpu));
    cache.emplace(key, model);

    std::cout << "Loaded whisper model: " << path << std::endl;
    return model;
}

WhisperBackend::WhisperBackend(const LocalModelOptions& local, const CommonModelOptions& common,
                               int sample_rate)
    : local_(local)
    , common_(common)
    , sample_rate_(sample_rate) {
}

bool WhisperBackend::initialize() {
    if (model_) return true;

    if (sample_rate_ != WHISPER_SAMPLE_RATE) {
        std::cerr << "Warning: whisper expects " << WHISPER_SAMPLE_RATE << "Hz audio, recording at "
                  << sample_rate_ << "Hz" << std::endl;
    }

    model_ = WhisperModel::acquire(local_);
    return model_ != nullptr;
}

TranscriptionResult WhisperBackend::transcribe(const AudioBuffer& audio) {
    TranscriptionResult result;

    if (!model_) {
        result.error = "Transcriber not initialized";
        return result;
    }

    std::vector<float> samples = to_float_samples(audio);

    if (local_.vad_filter) {
        samples = AudioProcessor::extract_speech(samples, VAD_THRESHOLD, VAD_MIN_SPEECH_MS,
                                                 VAD_PADDING_MS, sample_rate_);
    }

    // Whisper requires minimum 100ms of audio - pad with silence if too short
    size_t min_samples = static_cast<size_t>(sample_rate_ / 10);
    if (samples.size() < min_samples) {
        samples.resize(min_samples, 0.0f);
    }

    whisper_full_params wparams = whisper_full_default_params(WHISPER_SAMPLING_BEAM_SEARCH);

    wparams.print_progress   = false;
    wparams.print_special    = false;
    wparams.print_realtime   = false;
    wparams.print_timestamps = false;
    wparams.translate        = false;
    wparams.no_context       = !local_.condition_on_previous_text;
    wparams.language         = common_.language.empty() ? "auto" : common_.language.c_str();
    wparams.n_threads        = local_.n_threads;
    wparams.temperature      = common_.temperature;
    wparams.beam_search.beam_size = 5;

    if (!common_.initial_prompt.empty()) {
        wparams.initial_prompt = common_.initial_prompt.c_str();
    }

    std::lock_guard<std::mutex> lock(model_->mutex());
    whisper_context* ctx = model_->context();

    int ret = whisper_full(ctx, wparams, samples.data(), static_cast<int>(samples.size()));
    if (ret != 0) {
        result.error = "Whisper inference failed";
        return result;
    }

    const int n_segments = whisper_full_n_segments(ctx);
    std::string text;
    for (int i = 0; i < n_segments; ++i) {
        const char* segment_text = whisper_full_get_segment_text(ctx, i);
        if (segment_text) {
            text += segment_text;
        }
    }

    result.text = text;
    result.success = true;
    return result;
}

} // namespace wwriter
