#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

namespace fluent_request {
namespace services {

// HTTP method enumeration
enum class HttpMethod {
    GET,
    POST
};

// Request construction error types
enum class RequestErrorCode {
    InvalidUrl
};

struct RequestError {
    RequestErrorCode code = RequestErrorCode::InvalidUrl;
    std::string message;

    bool operator==(const RequestError&) const = default;
};

// Request timeout; fractional seconds are allowed
using Timeout = std::chrono::duration<double>;

// HTTP headers type
using HttpHeaders = std::unordered_map<std::string, std::string>;

// One name/value pair of a query string. Order and duplicates are significant.
struct QueryParameter {
    std::string name;
    std::string value;

    bool operator==(const QueryParameter&) const = default;
};

// Finished HTTP request description, ready to hand to a transport
struct HttpRequest {
    std::string url;
    HttpMethod method = HttpMethod::GET;
    HttpHeaders headers;
    std::optional<std::string> body;
    Timeout timeout{30.0};

    bool is_valid() const;
    std::optional<std::string> get_header(const std::string& name) const;

    bool operator==(const HttpRequest&) const = default;
};

std::string_view to_string(HttpMethod method);
std::string_view to_string(RequestErrorCode code);

} // namespace services
} // namespace fluent_request
