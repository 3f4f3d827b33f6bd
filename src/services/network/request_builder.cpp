#include "fluent_request/services/network/request_builder.hpp"
#include "fluent_request/utils/url_utils.hpp"
#include "fluent_request/utils/uuid.hpp"

namespace fluent_request {
namespace services {

RequestBuilder::RequestBuilder()
    : m_boundary("Boundary-" + utils::Uuid::generate_v4().to_string(true)) {}

RequestBuilder::RequestBuilder(const core::BuilderConfig& config) : RequestBuilder() {
    m_timeout = config.default_timeout;
    m_headers = config.default_headers;
    if (config.base_url) {
        set_base_url(*config.base_url);
    }
}

RequestBuilder& RequestBuilder::set_base_url(const std::string& url) {
    m_base_url = utils::Url::parse(url);
    if (!m_base_url) {
        FR_LOG_DEBUG("RequestBuilder", "Ignoring unparseable URL: " + url);
    }
    return *this;
}

RequestBuilder& RequestBuilder::set_full_url(const std::string& url) {
    return set_base_url(url);
}

RequestBuilder& RequestBuilder::add_path(const std::string& segment) {
    m_path_segments.push_back(segment);
    return *this;
}

RequestBuilder& RequestBuilder::add_path_segments(const std::vector<std::string>& segments) {
    m_path_segments.insert(m_path_segments.end(), segments.begin(), segments.end());
    return *this;
}

RequestBuilder& RequestBuilder::set_method(HttpMethod method) {
    m_method = method;
    return *this;
}

RequestBuilder& RequestBuilder::add_header(const std::string& name, const std::string& value) {
    m_headers[name] = value;
    return *this;
}

RequestBuilder& RequestBuilder::set_headers(const HttpHeaders& headers) {
    m_headers = headers;
    return *this;
}

RequestBuilder& RequestBuilder::set_timeout(Timeout timeout) {
    m_timeout = timeout;
    return *this;
}

RequestBuilder& RequestBuilder::add_query_parameter(const std::string& name,
                                                    const std::optional<std::string>& value) {
    if (value) {
        m_query_parameters.push_back(QueryParameter{name, *value});
    }
    return *this;
}

RequestBuilder& RequestBuilder::add_query_parameters(const QueryParameterMap& params) {
    for (const auto& [name, value] : params) {
        add_query_parameter(name, value);
    }
    return *this;
}

RequestBuilder& RequestBuilder::set_body(const std::string& body) {
    m_body = body;
    return *this;
}

RequestBuilder& RequestBuilder::set_json_body(const nlohmann::json& json) {
    std::string encoded;
    try {
        encoded = json.dump();
    } catch (const std::exception& e) {
        FR_LOG_DEBUG("RequestBuilder", "JSON body not encodable: " + std::string(e.what()));
        return *this;
    }

    m_body = std::move(encoded);
    m_headers["Content-Type"] = "application/json";
    return *this;
}

std::expected<HttpRequest, RequestError> RequestBuilder::build() const {
    if (!m_base_url) {
        return std::unexpected(RequestError{
            RequestErrorCode::InvalidUrl,
            "Bad URL: no valid base URL has been set"
        });
    }

    auto url = assemble_url(*m_base_url);
    if (url.empty()) {
        return std::unexpected(RequestError{
            RequestErrorCode::InvalidUrl,
            "Bad URL: path segments could not be applied to the base URL"
        });
    }

    HttpRequest request;
    request.url = std::move(url);
    request.method = m_method;
    request.headers = m_headers;
    request.body = m_body;
    request.timeout = m_timeout;

    FR_LOG_DEBUG("RequestBuilder",
                 std::string(to_string(request.method)) + " " + request.url);
    return request;
}

std::string RequestBuilder::assemble_url(const utils::Url& base) const {
    utils::Url url = base;

    if (!m_path_segments.empty()) {
        auto path = url.path();
        for (const auto& segment : m_path_segments) {
            path = utils::UrlUtils::join_path(path, utils::UrlUtils::encode_path_segment(segment));
        }
        if (!url.set_path(path)) {
            return {};
        }
    }

    if (m_query_parameters.empty()) {
        return url.to_string().value_or(std::string());
    }

    // Parameters replace the base query; if they cannot be applied the URL goes out without one
    if (!url.clear_query()) {
        return {};
    }
    auto without_query = url.to_string();
    if (!without_query) {
        return {};
    }

    auto query = utils::UrlUtils::build_query_string(m_query_parameters);
    if (url.set_query(query)) {
        if (auto with_query = url.to_string()) {
            return *with_query;
        }
    }

    FR_LOG_WARNING("RequestBuilder", "Could not apply " + std::to_string(query.size()) +
                   "-byte query string, sending without it");
    return *without_query;
}

} // namespace services
} // namespace fluent_request
