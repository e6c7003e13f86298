#pragma once

#include "transcriber.hpp"
#include <string>

namespace wwriter {

// OpenAI-compatible /audio/transcriptions client (libsoup + json-glib).
// Audio is uploaded as a WAV file; the call blocks the session worker.
class ApiBackend : public TranscriptionBackend {
public:
    ApiBackend(const ApiOptions& api, const CommonModelOptions& common, int sample_rate);

    BackendKind kind() const override { return BackendKind::Api; }
    bool is_ready() const override { return true; }

    TranscriptionResult transcribe(const AudioBuffer& audio) override;

    // <base_url>/audio/transcriptions
    std::string endpoint_url() const;

    // Configured key, else $OPENAI_API_KEY
    std::string api_key() const;

    // Extract "text" from a JSON response body
    static TranscriptionResult parse_response(const char* body, size_t length);

private:
    ApiOptions api_;
    CommonModelOptions common_;
    int sample_rate_;
};

} // namespace wwriter
