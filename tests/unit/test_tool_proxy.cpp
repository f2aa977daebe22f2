#include <deque>
#include <optional>
#include <string>
#include <utility>
#include <gtest/gtest.h>
#include "logstore/log_store.hpp"
#include "proxy/tool_proxy.hpp"
#include "wrappee/wrappee_transport.hpp"

namespace {

using nlohmann::json;
using wrapmcp::core::errors::ErrorKind;
using wrapmcp::core::errors::get_error;
using wrapmcp::core::errors::get_value;
using wrapmcp::core::errors::is_error;
using wrapmcp::core::errors::Result;
using wrapmcp::core::errors::WrapError;
using wrapmcp::logstore::EntryType;
using wrapmcp::logstore::ErrorEntry;
using wrapmcp::logstore::LogFilter;
using wrapmcp::logstore::LogStore;
using wrapmcp::logstore::RequestEntry;
using wrapmcp::logstore::ResponseEntry;
using wrapmcp::proxy::ToolProxy;

// Scripted transport: each call pops the next queued reply.
class FakeTransport : public wrapmcp::wrappee::WrappeeTransport {
public:
    Result<json> initialize(const std::string&) override { return json::object(); }

    Result<json> list_tools() override { return next(); }

    Result<json> call_tool(const std::string& name, const json& arguments) override {
        last_name = name;
        last_arguments = arguments;
        return next();
    }

    std::optional<std::string> poll_stderr() override { return std::nullopt; }
    pid_t pid() const override { return 4242; }
    void shutdown() override {}

    void reply(json message) { replies_.emplace_back(std::in_place_index<0>, std::move(message)); }
    void fail(WrapError error) { replies_.emplace_back(std::in_place_index<1>, std::move(error)); }

    std::string last_name;
    json last_arguments;

private:
    Result<json> next() {
        if (replies_.empty()) {
            return WrapError{ErrorKind::IoClosed, "no scripted reply", "stdout_closed"};
        }
        Result<json> front = replies_.front();
        replies_.pop_front();
        return front;
    }

    std::deque<Result<json>> replies_;
};

json tools_response(std::initializer_list<const char*> names) {
    json tools = json::array();
    for (const char* name : names) {
        tools.push_back(json{{"name", name},
                             {"description", std::string("does ") + name},
                             {"inputSchema", {{"type", "object"}}}});
    }
    return json{{"jsonrpc", "2.0"}, {"id", 2}, {"result", {{"tools", tools}}}};
}

TEST(ToolProxyTest, DiscoverReplacesCachedTools) {
    LogStore store;
    ToolProxy proxy(store);
    FakeTransport transport;

    transport.reply(tools_response({"a", "b"}));
    auto first = proxy.discover(transport);
    ASSERT_FALSE(is_error(first));
    EXPECT_EQ(get_value(first), 2u);

    transport.reply(tools_response({"c"}));
    ASSERT_FALSE(is_error(proxy.discover(transport)));
    const auto tools = proxy.wrappee_tools();
    ASSERT_EQ(tools.size(), 1u);
    EXPECT_EQ(tools[0].name, "c");
}

TEST(ToolProxyTest, AllToolsAppendsBuiltins) {
    LogStore store;
    ToolProxy proxy(store);
    FakeTransport transport;
    transport.reply(tools_response({"search"}));
    ASSERT_FALSE(is_error(proxy.discover(transport)));

    const auto tools = proxy.all_tools();
    ASSERT_EQ(tools.size(), 4u);
    EXPECT_EQ(tools[0].name, "search");
    EXPECT_EQ(tools[1].name, "show_log");
    EXPECT_EQ(tools[2].name, "clear_log");
    EXPECT_EQ(tools[3].name, "restart_wrapped_server");

    proxy.clear_tools();
    EXPECT_EQ(proxy.all_tools().size(), 3u);
}

TEST(ToolProxyTest, FailedDiscoveryKeepsPreviousTools) {
    LogStore store;
    ToolProxy proxy(store);
    FakeTransport transport;
    transport.reply(tools_response({"keep"}));
    ASSERT_FALSE(is_error(proxy.discover(transport)));

    transport.reply(json{{"jsonrpc", "2.0"}, {"id", 2}, {"error", {{"message", "nope"}}}});
    auto rejected = proxy.discover(transport);
    ASSERT_TRUE(is_error(rejected));
    EXPECT_EQ(get_error(rejected).kind, ErrorKind::Protocol);

    transport.reply(json{{"jsonrpc", "2.0"}, {"id", 2}, {"result", {{"other", 1}}}});
    auto malformed = proxy.discover(transport);
    ASSERT_TRUE(is_error(malformed));
    EXPECT_EQ(get_error(malformed).code, "invalid_tools_list");

    ASSERT_EQ(proxy.wrappee_tools().size(), 1u);
    EXPECT_EQ(proxy.wrappee_tools()[0].name, "keep");
}

TEST(ToolProxyTest, StructuredResultIsPassedThrough) {
    LogStore store;
    ToolProxy proxy(store);
    FakeTransport transport;
    transport.reply(json{{"jsonrpc", "2.0"},
                         {"id", 3},
                         {"result",
                          {{"content", json::array({{{"type", "text"}, {"text", "hi"}}})},
                           {"isError", true}}}});

    auto result = proxy.call("greet", json{{"name", "Ada"}}, &transport);
    ASSERT_FALSE(is_error(result));
    EXPECT_TRUE(get_value(result).is_error);
    ASSERT_EQ(get_value(result).content.size(), 1u);
    EXPECT_EQ(get_value(result).content[0]["text"], "hi");
    EXPECT_EQ(transport.last_name, "greet");
    EXPECT_EQ(transport.last_arguments["name"], "Ada");

    const auto logs = store.get_logs();
    ASSERT_EQ(logs.size(), 2u);
    const auto& response = std::get<ResponseEntry>(logs[0].content);
    EXPECT_EQ(std::get<RequestEntry>(logs[1].content).tool_name, "greet");
    EXPECT_EQ(response.request_id, logs[1].id);
}

TEST(ToolProxyTest, UnstructuredResultBecomesText) {
    LogStore store;
    ToolProxy proxy(store);
    FakeTransport transport;
    transport.reply(json{{"jsonrpc", "2.0"}, {"id", 3}, {"result", {{"value", 42}}}});

    auto result = proxy.call("raw", json::object(), &transport);
    ASSERT_FALSE(is_error(result));
    ASSERT_EQ(get_value(result).content.size(), 1u);
    const json inner = json::parse(get_value(result).content[0]["text"].get<std::string>());
    EXPECT_EQ(inner["value"], 42);
}

TEST(ToolProxyTest, ErrorPayloadBecomesToolError) {
    LogStore store;
    ToolProxy proxy(store);
    FakeTransport transport;
    transport.reply(json{{"jsonrpc", "2.0"},
                         {"id", 3},
                         {"error", {{"code", -32000}, {"message", "boom"}, {"data", {{"k", 1}}}}}});

    auto result = proxy.call("t", json::object(), &transport);
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).kind, ErrorKind::Tool);
    EXPECT_EQ(get_error(result).message, "boom");
    EXPECT_EQ(get_error(result).data["k"], 1);

    const auto logs = store.get_logs();
    ASSERT_EQ(logs.size(), 2u);
    const auto& error = std::get<ErrorEntry>(logs[0].content);
    EXPECT_EQ(error.request_id, logs[1].id);
    EXPECT_EQ(error.message, "boom");
}

TEST(ToolProxyTest, ErrorWithoutMessageUsesDefault) {
    LogStore store;
    ToolProxy proxy(store);
    FakeTransport transport;
    transport.reply(json{{"jsonrpc", "2.0"}, {"id", 3}, {"error", {{"code", 1}}}});

    auto result = proxy.call("t", json::object(), &transport);
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).message, "Unknown error");
}

TEST(ToolProxyTest, TransportFailureIsLoggedOnce) {
    LogStore store;
    ToolProxy proxy(store);
    FakeTransport transport;
    transport.fail(WrapError{ErrorKind::Timeout, "tools/call timed out", "response_timeout"});

    auto result = proxy.call("slow", json::object(), &transport);
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).kind, ErrorKind::Timeout);
    EXPECT_EQ(get_error(result).message, "Failed to call tool: tools/call timed out");

    LogFilter errors;
    errors.entry_type = EntryType::Error;
    EXPECT_EQ(store.get_logs(std::nullopt, errors).size(), 1u);
    EXPECT_EQ(store.get_log_count(), 2u);
}

TEST(ToolProxyTest, MissingTransportIsNotInitialized) {
    LogStore store;
    ToolProxy proxy(store);

    auto result = proxy.call("t", json::object(), nullptr);
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).kind, ErrorKind::NotInitialized);
    EXPECT_EQ(store.get_log_count(), 2u);
}

TEST(ToolProxyTest, ResponseWithoutResultOrErrorIsReturnedAsText) {
    LogStore store;
    ToolProxy proxy(store);
    FakeTransport transport;
    transport.reply(json{{"jsonrpc", "2.0"}, {"id", 3}});

    auto result = proxy.call("odd", json::object(), &transport);
    ASSERT_FALSE(is_error(result));
    EXPECT_NE(get_value(result).content[0]["text"].get<std::string>().find("jsonrpc"),
              std::string::npos);
}

}  // namespace
