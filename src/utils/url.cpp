#include "fluent_request/utils/url.hpp"

#include <new>

namespace fluent_request {
namespace utils {

std::optional<Url> Url::parse(std::string_view url) {
    if (url.empty()) {
        return std::nullopt;
    }

    HandlePtr handle(curl_url());
    if (!handle) {
        return std::nullopt;
    }

    const std::string url_string(url);
    if (curl_url_set(handle.get(), CURLUPART_URL, url_string.c_str(), 0) != CURLUE_OK) {
        return std::nullopt;
    }

    Url parsed(std::move(handle));

    auto scheme = parsed.scheme();
    if (scheme != "http" && scheme != "https") {
        return std::nullopt;
    }
    if (parsed.host().empty()) {
        return std::nullopt;
    }

    return parsed;
}

Url::Url(HandlePtr handle) : m_handle(std::move(handle)) {}

Url::Url(const Url& other) {
    if (other.m_handle) {
        m_handle.reset(curl_url_dup(other.m_handle.get()));
        if (!m_handle) {
            throw std::bad_alloc();
        }
    }
}

Url& Url::operator=(const Url& other) {
    if (this != &other) {
        Url copy(other);
        m_handle = std::move(copy.m_handle);
    }
    return *this;
}

std::string Url::scheme() const {
    return get_part(CURLUPART_SCHEME).value_or("");
}

std::string Url::host() const {
    return get_part(CURLUPART_HOST).value_or("");
}

std::string Url::path() const {
    auto path = get_part(CURLUPART_PATH).value_or("/");
    if (path.empty() || path.front() != '/') {
        path.insert(path.begin(), '/');
    }
    return path;
}

bool Url::set_path(const std::string& encoded_path) {
    if (!m_handle) return false;
    return curl_url_set(m_handle.get(), CURLUPART_PATH, encoded_path.c_str(), 0) == CURLUE_OK;
}

std::optional<std::string> Url::query() const {
    return get_part(CURLUPART_QUERY);
}

bool Url::set_query(const std::string& encoded_query) {
    if (!m_handle) return false;
    return curl_url_set(m_handle.get(), CURLUPART_QUERY, encoded_query.c_str(), 0) == CURLUE_OK;
}

bool Url::clear_query() {
    if (!m_handle) return false;
    return curl_url_set(m_handle.get(), CURLUPART_QUERY, nullptr, 0) == CURLUE_OK;
}

std::optional<std::string> Url::to_string() const {
    return get_part(CURLUPART_URL);
}

bool Url::operator==(const Url& other) const {
    return to_string() == other.to_string();
}

std::optional<std::string> Url::get_part(CURLUPart part) const {
    if (!m_handle) return std::nullopt;

    char* value = nullptr;
    if (curl_url_get(m_handle.get(), part, &value, 0) != CURLUE_OK || value == nullptr) {
        return std::nullopt;
    }

    std::string result(value);
    curl_free(value);
    return result;
}

} // namespace utils
} // namespace fluent_request
