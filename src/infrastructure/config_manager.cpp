#include "infrastructure/config_manager.h"
#include "infrastructure/logger.h"
#include "domain/errors.h"
#include "domain/ipv6_network.h"
#include <algorithm>
#include <cctype>
#include <fstream>
#include <nlohmann/json.hpp>
#include <sstream>
#include <yaml-cpp/yaml.h>

extern char** environ;

namespace ip6gen::infrastructure {

namespace {

std::string to_lower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

bool parse_bool(const std::string& key, const std::string& value) {
    std::string lower = to_lower(value);
    if (lower == "true" || lower == "1" || lower == "yes" || lower == "on") return true;
    if (lower == "false" || lower == "0" || lower == "no" || lower == "off") return false;
    THROW_CONFIG_ERROR("invalid boolean '" + value + "' for " + key);
}

bool is_known_format(const std::string& format) {
    return format == "text" || format == "json";
}

}

void ConfigManager::load_config(const std::string& file_path) {
    load_config(file_path, detect_format(file_path));
}

void ConfigManager::load_config(const std::string& file_path, ConfigFormat format) {
    std::ifstream file(file_path);
    if (!file.is_open()) {
        THROW_CONFIG_ERROR("failed to open config file: " + file_path);
    }

    std::string content((std::istreambuf_iterator<char>(file)),
                        std::istreambuf_iterator<char>());
    file.close();

    if (content.empty()) {
        LOG_WARNING("config", "config file is empty, using defaults", {{"file", file_path}});
        return;
    }

    load_from_string(content, format);

    {
        std::unique_lock<std::shared_mutex> lock(config_mutex_);
        config_file_path_ = file_path;
    }
    LOG_INFO("config", "config loaded successfully", {{"file", file_path}});
}

void ConfigManager::load_from_string(const std::string& config_data, ConfigFormat format) {
    switch (format) {
        case ConfigFormat::YAML:
            parse_yaml_config(config_data);
            break;
        case ConfigFormat::JSON:
            parse_json_config(config_data);
            break;
    }
}

void ConfigManager::load_environment_variables(const std::string& prefix) {
    size_t applied = 0;
    for (char** env = environ; env != nullptr && *env != nullptr; ++env) {
        std::string env_var = *env;
        if (!env_var.starts_with(prefix)) {
            continue;
        }

        auto eq_pos = env_var.find('=');
        if (eq_pos == std::string::npos) {
            continue;
        }

        std::string key = to_lower(env_var.substr(prefix.length(), eq_pos - prefix.length()));
        std::replace(key.begin(), key.end(), '_', '.');
        std::string value = env_var.substr(eq_pos + 1);

        if (set_value(key, value)) {
            ++applied;
        } else {
            LOG_DEBUG("config", "ignoring unknown environment override", {{"variable", env_var.substr(0, eq_pos)}});
        }
    }

    LOG_DEBUG("config", "environment variables loaded",
              {{"prefix", prefix}, {"applied", std::to_string(applied)}});
}

bool ConfigManager::set_value(const std::string& key, const std::string& value) {
    std::unique_lock<std::shared_mutex> lock(config_mutex_);
    return apply_value(key, value);
}

bool ConfigManager::apply_value(const std::string& key, const std::string& value) {
    if (key == "network") {
        config_.network = value;
    } else if (key == "output.format") {
        config_.output.format = to_lower(value);
    } else if (key == "output.expanded") {
        config_.output.expanded = parse_bool(key, value);
    } else if (key == "logging.level") {
        config_.logging.level = to_lower(value);
    } else if (key == "logging.file") {
        config_.logging.file = value;
    } else if (key == "logging.json") {
        config_.logging.json = parse_bool(key, value);
    } else {
        return false;
    }
    return true;
}

std::vector<ConfigManager::ValidationError> ConfigManager::validate_config() const {
    GeneratorConfig config = get_config();
    std::vector<ValidationError> errors;

    if (!config.network.empty()) {
        try {
            auto network = domain::parse_network(config.network);
            if (network.is_single_host()) {
                errors.push_back({ValidationResult::INVALID_VALUE_RANGE, "network",
                                  config.network + " is already a full IPv6 address",
                                  "use a prefix shorter than /128"});
            }
        } catch (const domain::InvalidNetworkException& e) {
            errors.push_back({ValidationResult::INVALID_VALUE_TYPE, "network",
                              e.get_diagnostic(),
                              "use CIDR notation such as fd52:f6b0:3162::/64"});
        }
    }

    if (!is_known_format(config.output.format)) {
        errors.push_back({ValidationResult::INVALID_VALUE_RANGE, "output.format",
                          "unknown output format '" + config.output.format + "'",
                          "use text or json"});
    }

    if (!Logger::string_to_log_level(config.logging.level)) {
        errors.push_back({ValidationResult::INVALID_VALUE_RANGE, "logging.level",
                          "unknown log level '" + config.logging.level + "'",
                          "use trace, debug, info, warning, error or critical"});
    }

    return errors;
}

bool ConfigManager::is_config_valid() const {
    return validate_config().empty();
}

GeneratorConfig ConfigManager::get_config() const {
    std::shared_lock<std::shared_mutex> lock(config_mutex_);
    return config_;
}

void ConfigManager::update_config(const GeneratorConfig& config) {
    std::unique_lock<std::shared_mutex> lock(config_mutex_);
    config_ = config;
}

std::string ConfigManager::get_config_file_path() const {
    std::shared_lock<std::shared_mutex> lock(config_mutex_);
    return config_file_path_;
}

std::string ConfigManager::export_config_yaml() const {
    GeneratorConfig config = get_config();

    YAML::Emitter out;
    out << YAML::BeginMap;
    out << YAML::Key << "network" << YAML::Value << config.network;
    out << YAML::Key << "output" << YAML::Value << YAML::BeginMap;
    out << YAML::Key << "format" << YAML::Value << config.output.format;
    out << YAML::Key << "expanded" << YAML::Value << config.output.expanded;
    out << YAML::EndMap;
    out << YAML::Key << "logging" << YAML::Value << YAML::BeginMap;
    out << YAML::Key << "level" << YAML::Value << config.logging.level;
    out << YAML::Key << "file" << YAML::Value << config.logging.file;
    out << YAML::Key << "json" << YAML::Value << config.logging.json;
    out << YAML::EndMap;
    out << YAML::EndMap;

    return out.c_str();
}

std::string ConfigManager::export_config_json() const {
    GeneratorConfig config = get_config();

    nlohmann::json j;
    j["network"] = config.network;
    j["output"]["format"] = config.output.format;
    j["output"]["expanded"] = config.output.expanded;
    j["logging"]["level"] = config.logging.level;
    j["logging"]["file"] = config.logging.file;
    j["logging"]["json"] = config.logging.json;

    return j.dump(2);
}

ConfigManager::ConfigFormat ConfigManager::detect_format(const std::string& file_path) {
    std::string lower = to_lower(file_path);
    if (lower.ends_with(".json")) {
        return ConfigFormat::JSON;
    }
    return ConfigFormat::YAML;
}

std::vector<std::string> ConfigManager::get_config_keys() {
    return {"network", "output.format", "output.expanded",
            "logging.level", "logging.file", "logging.json"};
}

void ConfigManager::parse_yaml_config(const std::string& content) {
    GeneratorConfig parsed = get_config();

    try {
        YAML::Node root = YAML::Load(content);
        if (root.IsNull()) {
            return;
        }
        if (!root.IsMap()) {
            THROW_CONFIG_ERROR("config root must be a mapping");
        }

        if (root["network"]) parsed.network = root["network"].as<std::string>();

        if (root["output"]) {
            auto output = root["output"];
            if (output["format"]) parsed.output.format = to_lower(output["format"].as<std::string>());
            if (output["expanded"]) parsed.output.expanded = output["expanded"].as<bool>();
        }

        if (root["logging"]) {
            auto logging = root["logging"];
            if (logging["level"]) parsed.logging.level = to_lower(logging["level"].as<std::string>());
            if (logging["file"]) parsed.logging.file = logging["file"].as<std::string>();
            if (logging["json"]) parsed.logging.json = logging["json"].as<bool>();
        }
    } catch (const YAML::Exception& e) {
        THROW_CONFIG_ERROR(std::string("failed to parse yaml config: ") + e.what());
    }

    update_config(parsed);
}

void ConfigManager::parse_json_config(const std::string& content) {
    GeneratorConfig parsed = get_config();

    try {
        auto root = nlohmann::json::parse(content);
        if (!root.is_object()) {
            THROW_CONFIG_ERROR("config root must be an object");
        }

        parsed.network = root.value("network", parsed.network);

        if (root.contains("output")) {
            const auto& output = root.at("output");
            parsed.output.format = to_lower(output.value("format", parsed.output.format));
            parsed.output.expanded = output.value("expanded", parsed.output.expanded);
        }

        if (root.contains("logging")) {
            const auto& logging = root.at("logging");
            parsed.logging.level = to_lower(logging.value("level", parsed.logging.level));
            parsed.logging.file = logging.value("file", parsed.logging.file);
            parsed.logging.json = logging.value("json", parsed.logging.json);
        }
    } catch (const nlohmann::json::exception& e) {
        THROW_CONFIG_ERROR(std::string("failed to parse json config: ") + e.what());
    }

    update_config(parsed);
}

}
