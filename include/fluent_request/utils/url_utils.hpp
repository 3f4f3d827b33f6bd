#pragma once

#include "fluent_request/services/network/http_types.hpp"

#include <string>
#include <vector>

namespace fluent_request {
namespace utils {

// URL utilities
class UrlUtils {
public:
    // Percent-encode everything except RFC 3986 unreserved characters
    static std::string encode(const std::string& str);

    // Percent-encode characters that may not appear in a path
    static std::string encode_path_segment(const std::string& segment);

    static std::string join_path(const std::string& base, const std::string& path);

    // Ordered "name=value&name=value" with names and values percent-encoded
    static std::string build_query_string(const std::vector<services::QueryParameter>& params);

    static bool is_valid_url(const std::string& url);
};

} // namespace utils
} // namespace fluent_request
