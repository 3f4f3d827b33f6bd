#include "fluent_request/utils/url_utils.hpp"
#include "fluent_request/utils/url.hpp"

#include <cctype>
#include <iomanip>
#include <sstream>
#include <string_view>

namespace fluent_request {
namespace utils {

namespace {
    bool is_unreserved(unsigned char c) {
        return std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~';
    }

    bool is_path_char(unsigned char c) {
        constexpr std::string_view allowed = "!$&'()*+,;=:@/";
        return is_unreserved(c) || allowed.find(static_cast<char>(c)) != std::string_view::npos;
    }

    template<typename Pred>
    std::string percent_encode(const std::string& str, Pred keep) {
        std::ostringstream encoded;
        encoded.fill('0');
        encoded << std::hex;

        for (char c : str) {
            unsigned char uc = static_cast<unsigned char>(c);
            if (keep(uc)) {
                encoded << c;
            } else {
                encoded << std::uppercase;
                encoded << '%' << std::setw(2) << static_cast<int>(uc);
                encoded << std::nouppercase;
            }
        }

        return encoded.str();
    }
}

std::string UrlUtils::encode(const std::string& str) {
    return percent_encode(str, is_unreserved);
}

std::string UrlUtils::encode_path_segment(const std::string& segment) {
    return percent_encode(segment, is_path_char);
}

std::string UrlUtils::join_path(const std::string& base, const std::string& path) {
    if (base.empty()) return path;
    if (path.empty()) return base;

    bool base_ends_with_slash = base.back() == '/';
    bool path_starts_with_slash = path.front() == '/';

    if (base_ends_with_slash && path_starts_with_slash) {
        return base + path.substr(1);
    } else if (!base_ends_with_slash && !path_starts_with_slash) {
        return base + "/" + path;
    } else {
        return base + path;
    }
}

std::string UrlUtils::build_query_string(const std::vector<services::QueryParameter>& params) {
    std::ostringstream oss;
    bool first = true;

    for (const auto& [name, value] : params) {
        if (!first) oss << "&";
        oss << encode(name) << "=" << encode(value);
        first = false;
    }

    return oss.str();
}

bool UrlUtils::is_valid_url(const std::string& url) {
    return Url::parse(url).has_value();
}

} // namespace utils
} // namespace fluent_request
