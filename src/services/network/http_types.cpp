#include "fluent_request/services/network/http_types.hpp"
#include "fluent_request/utils/url_utils.hpp"

#include <algorithm>
#include <cctype>

namespace fluent_request {
namespace services {

bool HttpRequest::is_valid() const {
    return !url.empty() && utils::UrlUtils::is_valid_url(url);
}

// Lookup ignores case; stored names are left as given
std::optional<std::string> HttpRequest::get_header(const std::string& name) const {
    auto it = std::find_if(headers.begin(), headers.end(),
        [&name](const auto& pair) {
            return std::equal(pair.first.begin(), pair.first.end(),
                            name.begin(), name.end(),
                            [](char a, char b) {
                                return std::tolower(static_cast<unsigned char>(a)) ==
                                       std::tolower(static_cast<unsigned char>(b));
                            });
        });
    return it != headers.end() ? std::make_optional(it->second) : std::nullopt;
}

std::string_view to_string(HttpMethod method) {
    switch (method) {
        case HttpMethod::GET: return "GET";
        case HttpMethod::POST: return "POST";
    }
    return "GET";
}

std::string_view to_string(RequestErrorCode code) {
    switch (code) {
        case RequestErrorCode::InvalidUrl: return "invalid URL";
    }
    return "unknown error";
}

} // namespace services
} // namespace fluent_request
