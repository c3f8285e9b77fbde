#include <map>
#include <optional>
#include <string>
#include <gtest/gtest.h>
#include "core/config/app_config.hpp"
#include "core/errors/agent_errors.hpp"

namespace {

using toolpilot::core::config::EnvLookup;
using toolpilot::core::config::load_from_environment;
using toolpilot::core::errors::ErrorCategory;
using toolpilot::core::errors::get_error;
using toolpilot::core::errors::get_value;
using toolpilot::core::errors::is_error;
using toolpilot::core::logging::LogLevel;

EnvLookup fake_env(std::map<std::string, std::string> values) {
    return [values](const std::string& name) -> std::optional<std::string> {
        const auto it = values.find(name);
        if (it == values.end()) {
            return std::nullopt;
        }
        return it->second;
    };
}

TEST(AppConfigTest, LoadsRequiredValuesAndDefaults) {
    auto result = load_from_environment(fake_env({{"API_KEY", "sk-test"}, {"MODEL", "gpt-4o"}}));
    ASSERT_FALSE(is_error(result));

    const auto& config = get_value(result);
    EXPECT_EQ(config.api_key, "sk-test");
    EXPECT_EQ(config.model, "gpt-4o");
    EXPECT_EQ(config.base_url, "https://api.openai.com/v1");
    EXPECT_DOUBLE_EQ(config.temperature, 1.0);
    EXPECT_EQ(config.max_turns, 25u);
    EXPECT_EQ(config.python_executable, "python3");
    EXPECT_EQ(config.default_timeout_seconds, 60u);
    EXPECT_EQ(config.allowed_permissions, "rwxn");
    EXPECT_EQ(config.log_level, LogLevel::INFO);
    EXPECT_FALSE(config.system_prompt.empty());
}

TEST(AppConfigTest, FailsWithoutApiKey) {
    auto result = load_from_environment(fake_env({{"MODEL", "gpt-4o"}}));
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).category, ErrorCategory::Configuration);
    EXPECT_EQ(get_error(result).code, "missing_api_key");
}

TEST(AppConfigTest, FailsWithoutModel) {
    auto result = load_from_environment(fake_env({{"API_KEY", "sk-test"}, {"MODEL", ""}}));
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "missing_model");
}

TEST(AppConfigTest, AppliesOptionalOverrides) {
    auto result = load_from_environment(fake_env({{"API_KEY", "k"},
                                                  {"MODEL", "m"},
                                                  {"BASE_URL", "http://localhost:8080/v1/"},
                                                  {"TOOLPILOT_PYTHON", "/opt/py/bin/python3"},
                                                  {"TOOLPILOT_LOG_LEVEL", "warn"}}));
    ASSERT_FALSE(is_error(result));

    const auto& config = get_value(result);
    EXPECT_EQ(config.base_url, "http://localhost:8080/v1");
    EXPECT_EQ(config.python_executable, "/opt/py/bin/python3");
    EXPECT_EQ(config.log_level, LogLevel::WARN);
}

TEST(AppConfigTest, RejectsMalformedValues) {
    auto bad_url = load_from_environment(
        fake_env({{"API_KEY", "k"}, {"MODEL", "m"}, {"BASE_URL", "localhost:8080"}}));
    ASSERT_TRUE(is_error(bad_url));
    EXPECT_EQ(get_error(bad_url).code, "invalid_config");

    auto bad_level = load_from_environment(
        fake_env({{"API_KEY", "k"}, {"MODEL", "m"}, {"TOOLPILOT_LOG_LEVEL", "loud"}}));
    ASSERT_TRUE(is_error(bad_level));
    EXPECT_EQ(get_error(bad_level).code, "invalid_config");
}

}  // namespace
