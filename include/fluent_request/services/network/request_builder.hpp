#pragma once

#include "fluent_request/core/config.hpp"
#include "fluent_request/services/network/http_types.hpp"
#include "fluent_request/utils/logger.hpp"
#include "fluent_request/utils/url.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <exception>
#include <expected>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace fluent_request {
namespace services {

using QueryParameterMap = std::unordered_map<std::string, std::optional<std::string>>;

/**
 * @brief Fluent builder for HttpRequest values
 *
 * Setters never fail and return the builder itself so calls can be chained.
 * Problems with the base URL are reported only by build(). A builder is meant
 * for a single call site; concurrent use of one instance must be externally
 * synchronized.
 *
 * @code
 * auto request = RequestBuilder()
 *     .set_base_url("https://api.example.com")
 *     .add_path("users")
 *     .add_query_parameter("active", "true")
 *     .build();
 * @endcode
 */
class RequestBuilder {
public:
    RequestBuilder();
    explicit RequestBuilder(const core::BuilderConfig& config);

    // URL / path
    RequestBuilder& set_base_url(const std::string& url);
    RequestBuilder& set_full_url(const std::string& url);
    RequestBuilder& add_path(const std::string& segment);
    RequestBuilder& add_path_segments(const std::vector<std::string>& segments);

    // Method, headers, timeout
    RequestBuilder& set_method(HttpMethod method);
    RequestBuilder& add_header(const std::string& name, const std::string& value);
    RequestBuilder& set_headers(const HttpHeaders& headers);
    RequestBuilder& set_timeout(Timeout timeout);

    // Query
    RequestBuilder& add_query_parameter(const std::string& name, const std::optional<std::string>& value);
    RequestBuilder& add_query_parameters(const QueryParameterMap& params);

    // Body
    RequestBuilder& set_body(const std::string& body);
    RequestBuilder& set_json_body(const nlohmann::json& json);

    /**
     * @brief Encode any value nlohmann::json can convert and use it as the body
     *
     * Sets Content-Type to application/json. If the conversion or encoding
     * throws, the builder is left untouched.
     */
    template<typename T>
    RequestBuilder& set_json_body(const T& object) {
        try {
            return set_json_body(nlohmann::json(object));
        } catch (const std::exception& e) {
            FR_LOG_DEBUG("RequestBuilder", "JSON body not encodable: " + std::string(e.what()));
            return *this;
        }
    }

    /**
     * @brief Validate the accumulated state and assemble the request
     *
     * @return std::expected<HttpRequest, RequestError> The finished request, or
     *         RequestErrorCode::InvalidUrl when no valid base URL was set
     */
    [[nodiscard]] std::expected<HttpRequest, RequestError> build() const;

    // Reserved for multipart bodies; unique per builder instance
    [[nodiscard]] const std::string& multipart_boundary() const { return m_boundary; }

private:
    std::string assemble_url(const utils::Url& base) const;

    std::optional<utils::Url> m_base_url;
    std::vector<std::string> m_path_segments;
    HttpMethod m_method = HttpMethod::GET;
    HttpHeaders m_headers;
    std::vector<QueryParameter> m_query_parameters;
    std::optional<std::string> m_body;
    Timeout m_timeout{30.0};
    std::string m_boundary;
};

} // namespace services
} // namespace fluent_request
