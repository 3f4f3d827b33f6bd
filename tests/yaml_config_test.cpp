#include "fluent_request/utils/yaml_config.hpp"

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>

using fluent_request::core::BuilderConfig;
using fluent_request::core::ConfigError;
using fluent_request::utils::LogLevel;
using fluent_request::utils::YamlConfigHelper;

namespace {

class TempDir {
public:
    TempDir()
        : m_path(std::filesystem::temp_directory_path() /
                 ("fluent_request_test_" + std::to_string(::testing::UnitTest::GetInstance()->random_seed()) +
                  "_" + ::testing::UnitTest::GetInstance()->current_test_info()->name())) {
        std::filesystem::create_directories(m_path);
    }
    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(m_path, ec);
    }

    const std::filesystem::path& path() const { return m_path; }

private:
    std::filesystem::path m_path;
};

} // namespace

TEST(YamlConfigTest, EmptyDocumentGivesDefaults) {
    auto config = YamlConfigHelper::load_from_string("");
    ASSERT_TRUE(config.has_value());
    EXPECT_EQ(*config, BuilderConfig{});
    EXPECT_DOUBLE_EQ(config->default_timeout.count(), 30.0);
    EXPECT_FALSE(config->base_url.has_value());
}

TEST(YamlConfigTest, ParsesRequestSection) {
    auto config = YamlConfigHelper::load_from_string(R"(
log_level: debug
request:
  base_url: https://api.example.com/v1
  timeout: 15
  headers:
    Accept: application/json
    X-Client: fluent
)");

    ASSERT_TRUE(config.has_value());
    EXPECT_EQ(config->log_level, LogLevel::Debug);
    EXPECT_EQ(config->base_url, "https://api.example.com/v1");
    EXPECT_DOUBLE_EQ(config->default_timeout.count(), 15.0);
    EXPECT_EQ(config->default_headers.size(), 2u);
    EXPECT_EQ(config->default_headers.at("X-Client"), "fluent");
}

TEST(YamlConfigTest, AcceptsFractionalTimeout) {
    auto config = YamlConfigHelper::load_from_string("request:\n  timeout: 0.5\n");
    ASSERT_TRUE(config.has_value());
    EXPECT_DOUBLE_EQ(config->default_timeout.count(), 0.5);
}

TEST(YamlConfigTest, RejectsInvalidValues) {
    auto zero_timeout = YamlConfigHelper::load_from_string("request:\n  timeout: 0\n");
    ASSERT_FALSE(zero_timeout.has_value());
    EXPECT_EQ(zero_timeout.error(), ConfigError::ValidationError);

    auto bad_url = YamlConfigHelper::load_from_string("request:\n  base_url: not a url\n");
    ASSERT_FALSE(bad_url.has_value());
    EXPECT_EQ(bad_url.error(), ConfigError::ValidationError);
}

TEST(YamlConfigTest, RejectsMalformedDocuments) {
    auto unterminated = YamlConfigHelper::load_from_string("request: [\n");
    ASSERT_FALSE(unterminated.has_value());
    EXPECT_EQ(unterminated.error(), ConfigError::InvalidFormat);

    auto headers_list = YamlConfigHelper::load_from_string("request:\n  headers:\n    - Accept\n");
    ASSERT_FALSE(headers_list.has_value());
    EXPECT_EQ(headers_list.error(), ConfigError::InvalidFormat);

    auto text_timeout = YamlConfigHelper::load_from_string("request:\n  timeout: soon\n");
    ASSERT_FALSE(text_timeout.has_value());
    EXPECT_EQ(text_timeout.error(), ConfigError::InvalidFormat);
}

TEST(YamlConfigTest, MissingFileIsReported) {
    TempDir dir;
    auto config = YamlConfigHelper::load_from_file(dir.path() / "missing.yaml");
    ASSERT_FALSE(config.has_value());
    EXPECT_EQ(config.error(), ConfigError::FileNotFound);
}

TEST(YamlConfigTest, SavedConfigLoadsBack) {
    TempDir dir;
    BuilderConfig config;
    config.base_url = "https://api.example.com";
    config.default_timeout = std::chrono::seconds(45);
    config.default_headers = {{"Accept", "application/json"}};
    config.log_level = LogLevel::Warning;

    auto path = dir.path() / "nested" / "config.yaml";
    ASSERT_TRUE(YamlConfigHelper::save_to_file(config, path).has_value());

    auto loaded = YamlConfigHelper::load_from_file(path);
    ASSERT_TRUE(loaded.has_value());
    EXPECT_EQ(*loaded, config);
}
