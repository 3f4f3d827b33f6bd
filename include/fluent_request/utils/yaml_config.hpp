#pragma once

#include "fluent_request/core/config.hpp"
#include <yaml-cpp/yaml.h>
#include <filesystem>
#include <expected>

namespace fluent_request {
namespace utils {

class YamlConfigHelper {
public:
    // Load and validate builder defaults from a YAML file
    static std::expected<core::BuilderConfig, core::ConfigError>
    load_from_file(const std::filesystem::path& path);

    static std::expected<core::BuilderConfig, core::ConfigError>
    load_from_string(const std::string& yaml);

    static std::expected<void, core::ConfigError>
    save_to_file(const core::BuilderConfig& config, const std::filesystem::path& path);

    // Convert between YAML nodes and config structures
    static core::BuilderConfig from_yaml(const YAML::Node& node);
    static YAML::Node to_yaml(const core::BuilderConfig& config);

private:
    static void parse_request_config(const YAML::Node& node, core::BuilderConfig& config);
    static std::expected<core::BuilderConfig, core::ConfigError>
    validated(core::BuilderConfig config);
};

} // namespace utils
} // namespace fluent_request
