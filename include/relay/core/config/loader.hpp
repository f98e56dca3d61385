#pragma once
#include <relay/core/config/app_config.hpp>
#include <string>

namespace YAML {
class Node;
}

class ConfigLoader {
public:
    /**
     * @brief Load and validate a YAML configuration file
     * @throws std::runtime_error on missing file, missing required field,
     *         wrong field type or out-of-range value
     */
    static AppConfig::AppConfiguration loadConfig(const std::string& filepath);

    /**
     * @brief Same as loadConfig() but from an in-memory YAML document
     */
    static AppConfig::AppConfiguration loadFromString(const std::string& yaml);

private:
    static AppConfig::AppConfiguration parse(const YAML::Node& root);
    static void validate(const AppConfig::AppConfiguration& config);
};
