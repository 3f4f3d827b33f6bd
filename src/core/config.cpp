#include "fluent_request/core/config.hpp"
#include "fluent_request/utils/url_utils.hpp"

namespace fluent_request {
namespace core {

bool BuilderConfig::is_valid() const {
    if (default_timeout.count() <= 0) {
        return false;
    }
    if (base_url && !utils::UrlUtils::is_valid_url(*base_url)) {
        return false;
    }
    return true;
}

std::string_view to_string(ConfigError error) {
    switch (error) {
        case ConfigError::FileNotFound: return "file not found";
        case ConfigError::InvalidFormat: return "invalid format";
        case ConfigError::ValidationError: return "validation error";
        case ConfigError::PermissionDenied: return "permission denied";
    }
    return "unknown error";
}

} // namespace core
} // namespace fluent_request
