#pragma once

#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include <curl/curl.h>

namespace fluent_request {
namespace utils {

/**
 * @brief Absolute http/https URL backed by libcurl's URL API
 *
 * Instances only exist in a parsed, valid state: construction goes through
 * parse(), which returns std::nullopt for anything curl rejects.
 */
class Url {
public:
    /**
     * @brief Parse an absolute URL
     *
     * @param url The URL string, e.g. "https://api.example.com/v1"
     * @return std::optional<Url> The parsed URL, or std::nullopt when the string
     *         is not an absolute http or https URL with a host
     */
    [[nodiscard]] static std::optional<Url> parse(std::string_view url);

    Url(const Url& other);
    Url& operator=(const Url& other);
    Url(Url&&) noexcept = default;
    Url& operator=(Url&&) noexcept = default;
    ~Url() = default;

    [[nodiscard]] std::string scheme() const;
    [[nodiscard]] std::string host() const;

    /**
     * @brief Current path, always starting with '/'
     */
    [[nodiscard]] std::string path() const;

    /**
     * @brief Replace the path with an already percent-encoded path
     *
     * @return bool False if curl rejected the path; the URL is left unchanged
     */
    bool set_path(const std::string& encoded_path);

    /**
     * @brief Current query string without the leading '?', if any
     */
    [[nodiscard]] std::optional<std::string> query() const;

    /**
     * @brief Replace the query with an already percent-encoded query string
     *
     * @return bool False if curl rejected the query; the URL is left unchanged
     */
    bool set_query(const std::string& encoded_query);

    // Drop the query entirely
    bool clear_query();

    /**
     * @brief Serialize the full URL
     *
     * @return std::optional<std::string> The URL, or std::nullopt if curl could
     *         not reassemble it
     */
    [[nodiscard]] std::optional<std::string> to_string() const;

    bool operator==(const Url& other) const;

private:
    struct HandleDeleter {
        void operator()(CURLU* handle) const { curl_url_cleanup(handle); }
    };
    using HandlePtr = std::unique_ptr<CURLU, HandleDeleter>;

    explicit Url(HandlePtr handle);

    [[nodiscard]] std::optional<std::string> get_part(CURLUPart part) const;

    HandlePtr m_handle;
};

} // namespace utils
} // namespace fluent_request
