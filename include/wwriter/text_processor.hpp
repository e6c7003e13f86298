#pragma once

#include "config.hpp"
#include <string>

namespace wwriter {

class TextProcessor {
public:
    TextProcessor() = default;
    explicit TextProcessor(const PostProcessingConfig& config);

    // Applies trim, trailing period removal, trailing space, lowercase - in that order
    std::string process(const std::string& text) const;

    // Individual operations (public for testing)
    static std::string trim(const std::string& text);
    static std::string remove_trailing_period(const std::string& text);
    static std::string add_trailing_space(const std::string& text);
    static std::string to_lower(const std::string& text);

    void set_config(const PostProcessingConfig& config) { config_ = config; }
    const PostProcessingConfig& get_config() const { return config_; }

private:
    PostProcessingConfig config_;
};

} // namespace wwriter
