#include "wwriter/text_processor.hpp"
#include <glib.h>

namespace wwriter {

TextProcessor::TextProcessor(const PostProcessingConfig& config)
    : config_(config) {}

std::string TextProcessor::process(const std::string& text) const {
    // Order matters: the period goes before the space is added, lowercasing runs last
    std::string result = trim(text);

    if (config_.remove_trailing_period) {
        result = remove_trailing_period(result);
    }

    if (config_.add_trailing_space) {
        result = add_trailing_space(result);
    }

    if (config_.remove_capitalization) {
        result = to_lower(result);
    }

    return result;
}

std::string TextProcessor::trim(const std::string& text) {
    size_t start = text.find_first_not_of(" \t\n\r");
    if (start == std::string::npos) return "";
    size_t end = text.find_last_not_of(" \t\n\r");
    return text.substr(start, end - start + 1);
}

std::string TextProcessor::remove_trailing_period(const std::string& text) {
    if (!text.empty() && text.back() == '.') {
        return text.substr(0, text.size() - 1);
    }
    return text;
}

std::string TextProcessor::add_trailing_space(const std::string& text) {
    return text + " ";
}

std::string TextProcessor::to_lower(const std::string& text) {
    gchar* valid = g_utf8_make_valid(text.c_str(), static_cast<gssize>(text.size()));
    gchar* lower = g_utf8_strdown(valid, -1);
    std::string result(lower);
    g_free(lower);
    g_free(valid);
    return result;
}

} // namespace wwriter
