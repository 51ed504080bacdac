#pragma once

#include <mutex>
#include <shared_mutex>
#include <string>
#include <vector>

namespace ip6gen::infrastructure {

struct GeneratorConfig {
    // Default CIDR for generation; empty means every request must name one.
    std::string network;

    struct Output {
        std::string format = "text";
        bool expanded = false;
    } output;

    struct Logging {
        std::string level = "warning";
        std::string file;
        bool json = false;
    } logging;
};

class ConfigManager {
public:
    enum class ConfigFormat {
        YAML,
        JSON
    };

    enum class ValidationResult {
        VALID,
        INVALID_VALUE_TYPE,
        INVALID_VALUE_RANGE,
        UNKNOWN_FIELD
    };

    struct ValidationError {
        ValidationResult result;
        std::string field;
        std::string message;
        std::string suggestion;
    };

    static constexpr const char* ENVIRONMENT_PREFIX = "IP6GEN_";

    ConfigManager() = default;
    ConfigManager(const ConfigManager&) = delete;
    ConfigManager& operator=(const ConfigManager&) = delete;

    // Throws ConfigurationException when the file is missing or malformed.
    void load_config(const std::string& file_path);
    void load_config(const std::string& file_path, ConfigFormat format);
    void load_from_string(const std::string& config_data, ConfigFormat format = ConfigFormat::YAML);

    // IP6GEN_OUTPUT_FORMAT=json sets "output.format".
    void load_environment_variables(const std::string& prefix = ENVIRONMENT_PREFIX);

    // Dotted key, e.g. "logging.level". Returns false for unknown keys;
    // throws ConfigurationException for a malformed value.
    bool set_value(const std::string& key, const std::string& value);

    std::vector<ValidationError> validate_config() const;
    bool is_config_valid() const;

    GeneratorConfig get_config() const;
    void update_config(const GeneratorConfig& config);
    std::string get_config_file_path() const;

    std::string export_config_yaml() const;
    std::string export_config_json() const;

    static ConfigFormat detect_format(const std::string& file_path);
    static std::vector<std::string> get_config_keys();

private:
    void parse_yaml_config(const std::string& content);
    void parse_json_config(const std::string& content);
    bool apply_value(const std::string& key, const std::string& value);

    mutable std::shared_mutex config_mutex_;
    GeneratorConfig config_;
    std::string config_file_path_;
};

}
