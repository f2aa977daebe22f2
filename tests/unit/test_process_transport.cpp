#include <chrono>
#include <csignal>
#include <filesystem>
#include <fstream>
#include <string>
#include <thread>
#include <gtest/gtest.h>
#include "protocol/tool_contract.hpp"
#include "wrappee/executable.hpp"
#include "wrappee/process_transport.hpp"

namespace {

using nlohmann::json;
using wrapmcp::core::errors::ErrorKind;
using wrapmcp::core::errors::get_error;
using wrapmcp::core::errors::get_value;
using wrapmcp::core::errors::is_error;
using wrapmcp::core::errors::take_value;
using wrapmcp::wrappee::ProcessTransport;
using wrapmcp::wrappee::TransportOptions;
using wrapmcp::wrappee::WrappeeSpawnConfig;

WrappeeSpawnConfig fake_config(std::vector<std::string> arguments = {}) {
    WrappeeSpawnConfig config;
    config.command = FAKE_WRAPPEE_PATH;
    config.arguments = std::move(arguments);
    return config;
}

std::unique_ptr<ProcessTransport> spawn_ready(const WrappeeSpawnConfig& config,
                                              TransportOptions options = {}) {
    auto spawned = ProcessTransport::spawn(config, options);
    EXPECT_FALSE(is_error(spawned));
    if (is_error(spawned)) {
        return nullptr;
    }
    auto transport = take_value(spawned);
    auto initialized = transport->initialize("2025-03-26");
    EXPECT_FALSE(is_error(initialized));
    return transport;
}

std::string first_text(const json& response) {
    return response["result"]["content"][0]["text"].get<std::string>();
}

TEST(ProcessTransportTest, SpawnFailsForUnknownCommand) {
    WrappeeSpawnConfig config;
    config.command = "definitely-not-a-real-command-xyz";
    auto spawned = ProcessTransport::spawn(config);
    ASSERT_TRUE(is_error(spawned));
    EXPECT_EQ(get_error(spawned).kind, ErrorKind::Spawn);
    EXPECT_EQ(get_error(spawned).code, "command_not_found");
}

TEST(ProcessTransportTest, SpawnFailsForNonExecutableFile) {
    const auto path = std::filesystem::temp_directory_path() / "wrapmcp_not_executable.txt";
    {
        std::ofstream out(path);
        out << "not a program";
    }
    std::filesystem::permissions(path, std::filesystem::perms::owner_read |
                                           std::filesystem::perms::owner_write);

    WrappeeSpawnConfig config;
    config.command = path.string();
    auto spawned = ProcessTransport::spawn(config);
    ASSERT_TRUE(is_error(spawned));
    EXPECT_EQ(get_error(spawned).kind, ErrorKind::Spawn);

    std::error_code ec;
    std::filesystem::remove(path, ec);
}

TEST(ProcessTransportTest, ResolvesCommandsOnPath) {
    const auto resolved = wrapmcp::wrappee::resolve_executable("sh");
    ASSERT_TRUE(resolved.has_value());
    EXPECT_TRUE(resolved->is_absolute());
    EXPECT_FALSE(wrapmcp::wrappee::resolve_executable("").has_value());
}

TEST(ProcessTransportTest, HandshakeAndListTools) {
    auto transport = spawn_ready(fake_config({"--tools", "alpha,beta"}));
    ASSERT_NE(transport, nullptr);
    EXPECT_GT(transport->pid(), 0);

    auto listed = transport->list_tools();
    ASSERT_FALSE(is_error(listed));
    const json& response = get_value(listed);
    EXPECT_EQ(response["id"], 2);
    ASSERT_EQ(response["result"]["tools"].size(), 2u);
    EXPECT_EQ(response["result"]["tools"][0]["name"], "alpha");
}

TEST(ProcessTransportTest, CallToolReturnsFullResponse) {
    auto transport = spawn_ready(fake_config());
    ASSERT_NE(transport, nullptr);

    auto called = transport->call_tool("echo", json{{"text", "hello"}});
    ASSERT_FALSE(is_error(called));
    EXPECT_EQ(get_value(called)["id"], 3);
    EXPECT_EQ(first_text(get_value(called)), "hello");

    auto failed = transport->call_tool("fail", json{{"message", "boom"}});
    ASSERT_FALSE(is_error(failed));
    EXPECT_EQ(get_value(failed)["error"]["message"], "boom");
}

TEST(ProcessTransportTest, RejectedInitializeIsProtocolError) {
    auto spawned = ProcessTransport::spawn(fake_config({"--reject-initialize"}));
    ASSERT_FALSE(is_error(spawned));
    auto transport = take_value(spawned);
    auto initialized = transport->initialize("2025-03-26");
    ASSERT_TRUE(is_error(initialized));
    EXPECT_EQ(get_error(initialized).kind, ErrorKind::Protocol);
}

TEST(ProcessTransportTest, SkipsNotificationsWhileWaiting) {
    auto transport = spawn_ready(fake_config());
    ASSERT_NE(transport, nullptr);

    auto called = transport->call_tool("notify", json::object());
    ASSERT_FALSE(is_error(called));
    EXPECT_EQ(first_text(get_value(called)), "notified");
}

TEST(ProcessTransportTest, TimesOutAndRecovers) {
    TransportOptions options;
    options.request_timeout = std::chrono::milliseconds(200);
    auto transport = spawn_ready(fake_config(), options);
    ASSERT_NE(transport, nullptr);

    auto slow = transport->call_tool("sleep", json{{"ms", 600}});
    ASSERT_TRUE(is_error(slow));
    EXPECT_EQ(get_error(slow).kind, ErrorKind::Timeout);

    // The late reply is discarded before the next request.
    std::this_thread::sleep_for(std::chrono::milliseconds(800));
    auto next = transport->call_tool("echo", json{{"text", "after"}});
    ASSERT_FALSE(is_error(next));
    EXPECT_EQ(first_text(get_value(next)), "after");
}

TEST(ProcessTransportTest, GarbageLineIsProtocolError) {
    auto transport = spawn_ready(fake_config());
    ASSERT_NE(transport, nullptr);

    auto called = transport->call_tool("garbage", json::object());
    ASSERT_TRUE(is_error(called));
    EXPECT_EQ(get_error(called).kind, ErrorKind::Protocol);
}

TEST(ProcessTransportTest, CrashIsIoClosed) {
    auto transport = spawn_ready(fake_config());
    ASSERT_NE(transport, nullptr);

    auto called = transport->call_tool("crash", json::object());
    ASSERT_TRUE(is_error(called));
    EXPECT_EQ(get_error(called).kind, ErrorKind::IoClosed);

    auto again = transport->call_tool("echo", json::object());
    ASSERT_TRUE(is_error(again));
    EXPECT_EQ(get_error(again).kind, ErrorKind::IoClosed);
}

TEST(ProcessTransportTest, ImmediateExitFailsHandshake) {
    auto spawned = ProcessTransport::spawn(fake_config({"--exit-immediately"}));
    ASSERT_FALSE(is_error(spawned));
    auto transport = take_value(spawned);
    auto initialized = transport->initialize("2025-03-26");
    ASSERT_TRUE(is_error(initialized));
    EXPECT_EQ(get_error(initialized).kind, ErrorKind::IoClosed);
}

TEST(ProcessTransportTest, StderrLinesArePolled) {
    auto transport = spawn_ready(fake_config({"--stderr", "booting up"}));
    ASSERT_NE(transport, nullptr);

    std::optional<std::string> line;
    for (int i = 0; i < 50 && !line.has_value(); ++i) {
        line = transport->poll_stderr();
        if (!line) {
            std::this_thread::sleep_for(std::chrono::milliseconds(20));
        }
    }
    ASSERT_TRUE(line.has_value());
    EXPECT_EQ(*line, "booting up");
    EXPECT_FALSE(transport->poll_stderr().has_value());
}

TEST(ProcessTransportTest, InjectsNoColorEnvironment) {
    auto transport = spawn_ready(fake_config());
    ASSERT_NE(transport, nullptr);
    auto called = transport->call_tool("env", json{{"name", "NO_COLOR"}});
    ASSERT_FALSE(is_error(called));
    EXPECT_EQ(first_text(get_value(called)), "1");

    auto config = fake_config();
    config.disable_colors = false;
    auto plain = spawn_ready(config);
    ASSERT_NE(plain, nullptr);
    auto style = plain->call_tool("env", json{{"name", "RUST_LOG_STYLE"}});
    ASSERT_FALSE(is_error(style));
    EXPECT_NE(first_text(get_value(style)), "never");
}

TEST(ProcessTransportTest, ShutdownKillsAndIsIdempotent) {
    auto transport = spawn_ready(fake_config());
    ASSERT_NE(transport, nullptr);
    const pid_t pid = transport->pid();

    transport->shutdown();
    transport->shutdown();
    EXPECT_NE(kill(pid, 0), 0);

    auto called = transport->call_tool("echo", json::object());
    ASSERT_TRUE(is_error(called));
    EXPECT_EQ(get_error(called).kind, ErrorKind::IoClosed);
}

}  // namespace
