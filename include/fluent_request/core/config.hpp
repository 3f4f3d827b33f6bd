#pragma once

#include "fluent_request/services/network/http_types.hpp"
#include "fluent_request/utils/logger.hpp"

#include <chrono>
#include <optional>
#include <string>

namespace fluent_request {
namespace core {

enum class ConfigError {
    FileNotFound,
    InvalidFormat,
    ValidationError,
    PermissionDenied
};

// Defaults applied to every RequestBuilder created from this configuration
struct BuilderConfig {
    std::optional<std::string> base_url;
    services::Timeout default_timeout{30.0};
    services::HttpHeaders default_headers;
    utils::LogLevel log_level = utils::LogLevel::Info;

    bool is_valid() const;

    bool operator==(const BuilderConfig&) const = default;
};

std::string_view to_string(ConfigError error);

} // namespace core
} // namespace fluent_request
