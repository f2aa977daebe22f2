#include <gtest/gtest.h>
#include "core/errors/wrap_errors.hpp"
#include "protocol/jsonrpc.hpp"

using namespace wrapmcp::core::errors;

// A dummy function to simulate a wrappee call failing
Result<std::string> simulate_call(bool should_fail) {
    if (should_fail) {
        return WrapError{ErrorKind::Timeout, "No response", "response_timeout"};
    }
    return std::string("tool output");
}

Status simulate_write(bool should_fail) {
    if (should_fail) {
        return WrapError{ErrorKind::IoClosed, "Wrappee stdin closed unexpectedly", "stdin_closed"};
    }
    return ok();
}

TEST(ErrorModelTest, HandlesSuccess) {
    auto result = simulate_call(false);

    EXPECT_FALSE(is_error(result));
    EXPECT_EQ(get_value(result), "tool output");
}

TEST(ErrorModelTest, HandlesFailure) {
    auto result = simulate_call(true);

    EXPECT_TRUE(is_error(result));
    auto error = get_error(result);
    EXPECT_EQ(error.kind, ErrorKind::Timeout);
    EXPECT_EQ(error.message, "No response");
    EXPECT_EQ(error.code, "response_timeout");
    EXPECT_TRUE(error.data.is_null());
}

TEST(ErrorModelTest, StatusCarriesNoValue) {
    EXPECT_FALSE(is_error(simulate_write(false)));
    auto failed = simulate_write(true);
    ASSERT_TRUE(is_error(failed));
    EXPECT_EQ(get_error(failed).kind, ErrorKind::IoClosed);
}

TEST(ErrorModelTest, TakeValueMovesOut) {
    Result<std::string> result = std::string("moved");
    const std::string value = take_value(result);
    EXPECT_EQ(value, "moved");
}

TEST(ErrorModelTest, KindNamesAreStable) {
    EXPECT_EQ(to_string(ErrorKind::Spawn), "spawn");
    EXPECT_EQ(to_string(ErrorKind::ConfigMissing), "config_missing");
    EXPECT_EQ(to_string(ErrorKind::NotInitialized), "not_initialized");
}

TEST(ErrorModelTest, InputErrorsMapToInvalidParams) {
    namespace jsonrpc = wrapmcp::protocol::jsonrpc;
    EXPECT_EQ(jsonrpc::error_code_for(WrapError{ErrorKind::Input, "bad"}), jsonrpc::kInvalidParams);
    EXPECT_EQ(jsonrpc::error_code_for(WrapError{ErrorKind::Tool, "boom"}), jsonrpc::kInternalError);
    EXPECT_EQ(jsonrpc::error_code_for(WrapError{ErrorKind::NotInitialized, "none"}),
              jsonrpc::kInternalError);
}

TEST(ErrorModelTest, ErrorResponseCarriesData) {
    namespace jsonrpc = wrapmcp::protocol::jsonrpc;
    const auto response = jsonrpc::make_error(7, jsonrpc::kInternalError, "boom",
                                              nlohmann::json{{"reason", "requested"}});
    EXPECT_EQ(response["id"], 7);
    EXPECT_EQ(response["error"]["code"], -32603);
    EXPECT_EQ(response["error"]["data"]["reason"], "requested");

    const auto without = jsonrpc::make_error(nullptr, jsonrpc::kParseError, "Parse error");
    EXPECT_FALSE(without["error"].contains("data"));
    EXPECT_TRUE(without["id"].is_null());
}
