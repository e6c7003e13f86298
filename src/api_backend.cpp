#include "wwriter/api_backend.hpp"
#include <libsoup/soup.h>
#include <json-glib/json-glib.h>
#include <iostream>
#include <sstream>
#include <cstdlib>

namespace wwriter {

ApiBackend::ApiBackend(const ApiOptions& api, const CommonModelOptions& common, int sample_rate)
    : api_(api)
    , common_(common)
    , sample_rate_(sample_rate) {
}

std::string ApiBackend::endpoint_url() const {
    std::string base = api_.base_url.empty() ? "https://api.openai.com/v1" : api_.base_url;
    while (!base.empty() && base.back() == '/') {
        base.pop_back();
    }
    return base + "/audio/transcriptions";
}

std::string ApiBackend::api_key() const {
    if (!api_.api_key.empty()) return api_.api_key;
    const char* env = std::getenv("OPENAI_API_KEY");
    return env ? env : "";
}

TranscriptionResult ApiBackend::parse_response(const char* body, size_t length) {
    TranscriptionResult result;

    GError* error = nullptr;
    JsonParser* parser = json_parser_new();
    if (!json_parser_load_from_data(parser, body, static_cast<gssize>(length), &error)) {
        result.error = std::string("invalid response: ") + (error ? error->message : "parse error");
        if (error) g_error_free(error);
        g_object_unref(parser);
        return result;
    }

    JsonNode* root = json_parser_get_root(parser);
    if (!root || !JSON_NODE_HOLDS_OBJECT(root)) {
        result.error = "invalid response: expected a JSON object";
        g_object_unref(parser);
        return result;
    }

    JsonObject* obj = json_node_get_object(root);

    // {"error": {"message": "..."}}
    if (json_object_has_member(obj, "error")) {
        JsonNode* err_node = json_object_get_member(obj, "error");
        result.error = "API error";
        if (JSON_NODE_HOLDS_OBJECT(err_node)) {
            JsonObject* err_obj = json_node_get_object(err_node);
            if (json_object_has_member(err_obj, "message")) {
                const char* msg = json_object_get_string_member(err_obj, "message");
                if (msg) result.error = std::string("API error: ") + msg;
            }
        }
        g_object_unref(parser);
        return result;
    }

    if (!json_object_has_member(obj, "text")) {
        result.error = "no text in response";
        g_object_unref(parser);
        return result;
    }

    const char* text = json_object_get_string_member(obj, "text");
    result.text = text ? text : "";
    result.success = true;

    g_object_unref(parser);
    return result;
}

TranscriptionResult ApiBackend::transcribe(const AudioBuffer& audio) {
    TranscriptionResult result;

    std::vector<uint8_t> wav = encode_wav(audio, sample_rate_);
    GBytes* file_bytes = g_bytes_new(wav.data(), wav.size());

    // Build multipart form data
    SoupMultipart* multipart = soup_multipart_new(SOUP_FORM_MIME_TYPE_MULTIPART);
    soup_multipart_append_form_string(multipart, "model", api_.model.c_str());
    if (!common_.language.empty()) {
        soup_multipart_append_form_string(multipart, "language", common_.language.c_str());
    }
    if (!common_.initial_prompt.empty()) {
        soup_multipart_append_form_string(multipart, "prompt", common_.initial_prompt.c_str());
    }
    std::ostringstream temperature;
    temperature << common_.temperature;
    soup_multipart_append_form_string(multipart, "temperature", temperature.str().c_str());
    soup_multipart_append_form_file(multipart, "file", "audio.wav", "audio/wav", file_bytes);
    g_bytes_unref(file_bytes);

    std::string url = endpoint_url();
    SoupMessage* msg = soup_message_new_from_multipart(url.c_str(), multipart);
    soup_multipart_free(multipart);

    if (!msg) {
        result.error = "invalid API URL: " + url;
        return result;
    }

    std::string key = api_key();
    if (!key.empty()) {
        SoupMessageHeaders* headers = soup_message_get_request_headers(msg);
        std::string auth = "Bearer " + key;
        soup_message_headers_replace(headers, "Authorization", auth.c_str());
    }

    // Session per call: the worker thread owns it for the duration of the request
    SoupSession* session = soup_session_new();
    soup_session_set_timeout(session, 0);

    GError* error = nullptr;
    GBytes* response_bytes = soup_session_send_and_read(session, msg, nullptr, &error);
    guint status = soup_message_get_status(msg);

    g_object_unref(msg);
    g_object_unref(session);

    if (!response_bytes) {
        result.error = std::string("network error: ") + (error ? error->message : "unknown");
        if (error) g_error_free(error);
        return result;
    }

    gsize response_len = 0;
    const char* response_data =
        static_cast<const char*>(g_bytes_get_data(response_bytes, &response_len));

    if (status < 200 || status >= 300) {
        result = parse_response(response_data, response_len);
        std::string detail = result.error.empty() ? "" : " (" + result.error + ")";
        result.success = false;
        result.text.clear();
        result.error = "HTTP " + std::to_string(status) + detail;
        g_bytes_unref(response_bytes);
        return result;
    }

    result = parse_response(response_data, response_len);
    g_bytes_unref(response_bytes);
    return result;
}

} // namespace wwriter
