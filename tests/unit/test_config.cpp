#include <map>
#include <optional>
#include <string>
#include <gtest/gtest.h>
#include "core/config/wrap_config.hpp"

namespace {

using wrapmcp::core::config::load_from_env;
using wrapmcp::core::config::WrapConfig;
using wrapmcp::core::errors::ErrorKind;
using wrapmcp::core::errors::get_error;
using wrapmcp::core::errors::get_value;
using wrapmcp::core::errors::is_error;
using wrapmcp::core::logging::LogLevel;

wrapmcp::core::config::EnvLookup env_of(std::map<std::string, std::string> values) {
    return [values](const std::string& name) -> std::optional<std::string> {
        const auto it = values.find(name);
        if (it == values.end()) {
            return std::nullopt;
        }
        return it->second;
    };
}

TEST(ConfigTest, DefaultsWhenNothingIsSet) {
    auto result = load_from_env(env_of({}));
    ASSERT_FALSE(is_error(result));
    const WrapConfig& config = get_value(result);
    EXPECT_EQ(config.log_capacity, 1000u);
    EXPECT_EQ(config.tool_timeout, std::chrono::seconds(30));
    EXPECT_EQ(config.protocol_version, "2025-03-26");
    EXPECT_EQ(config.log_level, LogLevel::INFO);
    EXPECT_FALSE(config.log_colors);
    EXPECT_FALSE(config.watch_binary);
    EXPECT_TRUE(config.disable_wrappee_colors);
}

TEST(ConfigTest, ReadsAllVariables) {
    auto result = load_from_env(env_of({{"WRAP_MCP_LOGSIZE", "50"},
                                        {"WRAP_MCP_TOOL_TIMEOUT", "5"},
                                        {"WRAP_MCP_PROTOCOL_VERSION", "2024-11-05"},
                                        {"WRAP_MCP_LOG_COLORS", "TRUE"},
                                        {"WRAP_MCP_LOG_LEVEL", "Debug"}}));
    ASSERT_FALSE(is_error(result));
    const WrapConfig& config = get_value(result);
    EXPECT_EQ(config.log_capacity, 50u);
    EXPECT_EQ(config.tool_timeout, std::chrono::seconds(5));
    EXPECT_EQ(config.protocol_version, "2024-11-05");
    EXPECT_TRUE(config.log_colors);
    EXPECT_EQ(config.log_level, LogLevel::DEBUG);
}

TEST(ConfigTest, RejectsNonNumericLogSize) {
    auto result = load_from_env(env_of({{"WRAP_MCP_LOGSIZE", "lots"}}));
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).kind, ErrorKind::Input);
    EXPECT_EQ(get_error(result).code, "invalid_env_value");
}

TEST(ConfigTest, RejectsZeroTimeout) {
    auto result = load_from_env(env_of({{"WRAP_MCP_TOOL_TIMEOUT", "0"}}));
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "invalid_env_value");
}

TEST(ConfigTest, RejectsEmptyProtocolVersion) {
    auto result = load_from_env(env_of({{"WRAP_MCP_PROTOCOL_VERSION", ""}}));
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "invalid_env_value");
}

TEST(ConfigTest, RejectsUnknownLogLevel) {
    auto result = load_from_env(env_of({{"WRAP_MCP_LOG_LEVEL", "chatty"}}));
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "invalid_env_value");
    EXPECT_FALSE(get_error(result).hint.empty());
}

TEST(ConfigTest, ColorsStayOffForOtherValues) {
    auto result = load_from_env(env_of({{"WRAP_MCP_LOG_COLORS", "yes"}}));
    ASSERT_FALSE(is_error(result));
    EXPECT_FALSE(get_value(result).log_colors);
}

}  // namespace
