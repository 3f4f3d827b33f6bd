#include "fluent_request/services/network/request_builder.hpp"
#include "fluent_request/utils/logger.hpp"
#include "fluent_request/utils/yaml_config.hpp"
#include "version.h"

#include <nlohmann/json.hpp>

#include <iostream>
#include <map>

using namespace fluent_request;

namespace {
    struct NewUser {
        std::string name;
        std::string email;
    };
    NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(NewUser, name, email)

    void setup_logging(utils::LogLevel level) {
        auto logger = std::make_unique<utils::Logger>(level);
        logger->add_sink(std::make_unique<utils::ConsoleSink>());
        utils::LoggerManager::set_instance(std::move(logger));
    }

    nlohmann::json describe(const services::HttpRequest& request) {
        nlohmann::json out;
        out["method"] = std::string(services::to_string(request.method));
        out["url"] = request.url;
        out["headers"] = std::map<std::string, std::string>(request.headers.begin(), request.headers.end());
        out["timeout"] = request.timeout.count();
        if (request.body) {
            out["body"] = *request.body;
        }
        return out;
    }
}

int main(int argc, char* argv[]) {
    core::BuilderConfig config;
    config.base_url = "https://api.example.com/v1";

    if (argc > 1) {
        auto loaded = utils::YamlConfigHelper::load_from_file(argv[1]);
        if (!loaded) {
            std::cerr << "Failed to load " << argv[1] << ": "
                      << core::to_string(loaded.error()) << std::endl;
            return 1;
        }
        config = *loaded;
    }

    setup_logging(config.log_level);
    FR_LOG_INFO("Example", "fluent_request " FLUENT_REQUEST_VERSION_STRING);

    const bool include_inactive = argc > 2;

    services::RequestBuilder builder(config);
    builder.add_path_segments({"users", "search"})
        .add_query_parameter("active", "true")
        .add_query_parameter("include", include_inactive ? std::optional<std::string>("inactive") : std::nullopt)
        .add_header("Accept", "application/json");

    auto search = builder.build();
    if (!search) {
        FR_LOG_ERROR("Example", search.error().message);
        return 1;
    }
    std::cout << describe(*search).dump(2) << std::endl;

    auto create = services::RequestBuilder(config)
        .add_path("users")
        .set_method(services::HttpMethod::POST)
        .set_json_body(NewUser{"Ada", "ada@example.com"})
        .build();
    if (!create) {
        FR_LOG_ERROR("Example", create.error().message);
        return 1;
    }
    std::cout << describe(*create).dump(2) << std::endl;

    return 0;
}
