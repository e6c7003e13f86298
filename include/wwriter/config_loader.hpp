#pragma once

#include "config.hpp"
#include <string>

namespace wwriter {

struct ConfigLoadResult {
    Config config;
    bool success = false;
    std::string error;      // "<path>:<line>: <message>" on failure
};

class ConfigLoader {
public:
    // Load ~/.wwriter/config.ini, defaults if the file does not exist
    static ConfigLoadResult load_user_config();

    // Load from a specific file. Missing file is an error unless allow_missing
    static ConfigLoadResult load_from_file(const std::string& path, bool allow_missing = false);

    // Parse config text (path is only used in error messages)
    static ConfigLoadResult parse(const std::string& text, const std::string& path = "<config>");

    // Apply one fully qualified key ("model_options.local.model")
    static bool apply_option(Config& config, const std::string& key,
                             const std::string& value, std::string& error);

    // Range checks that cannot be done per key
    static bool validate(const Config& config, std::string& error);

    static std::string get_default_config_path();

    // Write a commented default config file (never overwrites)
    static bool create_default_config_file();
};

} // namespace wwriter
