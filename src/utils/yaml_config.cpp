#include "fluent_request/utils/yaml_config.hpp"
#include "fluent_request/utils/logger.hpp"
#include <fstream>

namespace fluent_request {
namespace utils {

std::expected<core::BuilderConfig, core::ConfigError>
YamlConfigHelper::load_from_file(const std::filesystem::path& path) {
    if (!std::filesystem::exists(path)) {
        FR_LOG_WARNING("YamlConfig", "File not found: " + path.string());
        return std::unexpected(core::ConfigError::FileNotFound);
    }

    try {
        YAML::Node node = YAML::LoadFile(path.string());
        return validated(from_yaml(node));
    } catch (const std::exception& e) {
        FR_LOG_ERROR("YamlConfig", "Parse error: " + std::string(e.what()));
        return std::unexpected(core::ConfigError::InvalidFormat);
    }
}

std::expected<core::BuilderConfig, core::ConfigError>
YamlConfigHelper::load_from_string(const std::string& yaml) {
    try {
        YAML::Node node = YAML::Load(yaml);
        return validated(from_yaml(node));
    } catch (const std::exception& e) {
        FR_LOG_ERROR("YamlConfig", "Parse error: " + std::string(e.what()));
        return std::unexpected(core::ConfigError::InvalidFormat);
    }
}

std::expected<void, core::ConfigError>
YamlConfigHelper::save_to_file(const core::BuilderConfig& config, const std::filesystem::path& path) {
    try {
        auto dir = path.parent_path();
        if (!dir.empty() && !std::filesystem::exists(dir)) {
            std::filesystem::create_directories(dir);
        }

        YAML::Node node = to_yaml(config);
        std::ofstream file(path);
        if (!file) {
            FR_LOG_ERROR("YamlConfig", "Cannot open file for writing: " + path.string());
            return std::unexpected(core::ConfigError::PermissionDenied);
        }

        file << node << '\n';
        return {};
    } catch (const std::exception& e) {
        FR_LOG_ERROR("YamlConfig", "Save error: " + std::string(e.what()));
        return std::unexpected(core::ConfigError::InvalidFormat);
    }
}

core::BuilderConfig YamlConfigHelper::from_yaml(const YAML::Node& node) {
    core::BuilderConfig config;

    if (!node || node.IsNull()) {
        return config;
    }

    if (node["log_level"]) {
        config.log_level = log_level_from_string(node["log_level"].as<std::string>());
    }

    if (node["request"]) {
        parse_request_config(node["request"], config);
    }

    return config;
}

YAML::Node YamlConfigHelper::to_yaml(const core::BuilderConfig& config) {
    YAML::Node node;

    node["log_level"] = to_string(config.log_level);

    if (config.base_url) {
        node["request"]["base_url"] = *config.base_url;
    }
    node["request"]["timeout"] = config.default_timeout.count();

    for (const auto& [name, value] : config.default_headers) {
        node["request"]["headers"][name] = value;
    }

    return node;
}

void YamlConfigHelper::parse_request_config(const YAML::Node& node, core::BuilderConfig& config) {
    if (node["base_url"]) {
        config.base_url = node["base_url"].as<std::string>();
    }

    if (node["timeout"]) {
        config.default_timeout = services::Timeout(node["timeout"].as<double>());
    }

    if (node["headers"]) {
        if (!node["headers"].IsMap()) {
            throw YAML::Exception(node["headers"].Mark(), "request.headers must be a mapping");
        }
        for (const auto& header : node["headers"]) {
            config.default_headers[header.first.as<std::string>()] = header.second.as<std::string>();
        }
    }
}

std::expected<core::BuilderConfig, core::ConfigError>
YamlConfigHelper::validated(core::BuilderConfig config) {
    if (!config.is_valid()) {
        FR_LOG_ERROR("YamlConfig", "Configuration failed validation");
        return std::unexpected(core::ConfigError::ValidationError);
    }
    return config;
}

} // namespace utils
} // namespace fluent_request
