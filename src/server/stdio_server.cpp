#include "server/stdio_server.hpp"

#include <istream>
#include <ostream>
#include "core/logging/logger.hpp"
#include "protocol/jsonrpc.hpp"

namespace wrapmcp::server {

namespace jsonrpc = protocol::jsonrpc;
using nlohmann::json;

namespace {

constexpr const char* kInstructions =
    "This is a transparent MCP wrapper that logs all requests/responses while proxying to a "
    "wrapped MCP server. Use show_log to inspect traffic and stderr output, clear_log to reset "
    "it, and restart_wrapped_server to reload the wrapped server.";

}  // namespace

StdioServer::StdioServer(ToolRouter& router, const core::config::WrapConfig& config,
                         std::istream& in, std::ostream& out)
    : router_(router), config_(config), in_(in), out_(out) {}

void StdioServer::run() {
    LOG_INFO("Serving MCP on stdio");
    std::string line;
    while (std::getline(in_, line)) {
        json reply = handle_line(line);
        if (!reply.is_null()) {
            write_message(reply);
        }
    }
    LOG_INFO("Upstream input closed");
}

json StdioServer::handle_line(const std::string& line) {
    if (line.find_first_not_of(" \t\r") == std::string::npos) {
        return nullptr;
    }
    json message = json::parse(line, nullptr, false);
    if (message.is_discarded()) {
        LOG_WARN("Unparseable upstream message");
        return jsonrpc::make_error(nullptr, jsonrpc::kParseError, "Parse error");
    }
    return handle_message(message);
}

json StdioServer::handle_message(const json& message) {
    if (!message.is_object()) {
        return jsonrpc::make_error(nullptr, jsonrpc::kInvalidRequest,
                                   "Invalid request: expected a JSON object");
    }
    if (!message.contains("method")) {
        // A response to something we never send; nothing to do.
        return nullptr;
    }
    if (!message["method"].is_string()) {
        return jsonrpc::make_error(message.value("id", json(nullptr)), jsonrpc::kInvalidRequest,
                                   "Invalid request: method must be a string");
    }

    const std::string method = message["method"].get<std::string>();
    const json params = message.value("params", json::object());

    if (!message.contains("id")) {
        if (method == "notifications/initialized") {
            client_initialized_.store(true);
            LOG_INFO("Upstream client initialized");
        } else {
            LOG_DEBUG("Ignoring upstream notification: " + method);
        }
        return nullptr;
    }
    return handle_request(message["id"], method, params);
}

json StdioServer::handle_request(const json& id, const std::string& method, const json& params) {
    LOG_DEBUG("Upstream request: " + method);
    if (method == "initialize") {
        return jsonrpc::make_result(id, initialize_result());
    }
    if (method == "ping") {
        return jsonrpc::make_result(id, json::object());
    }
    if (method == "tools/list") {
        json tools = json::array();
        for (const auto& tool : router_.list_tools()) {
            tools.push_back(protocol::to_json(tool));
        }
        return jsonrpc::make_result(id, json{{"tools", tools}});
    }
    if (method == "tools/call") {
        return handle_tools_call(id, params);
    }
    return jsonrpc::make_error(id, jsonrpc::kMethodNotFound, "Method not found: " + method);
}

json StdioServer::handle_tools_call(const json& id, const json& params) {
    if (!params.is_object() || !params.contains("name") || !params["name"].is_string()) {
        return jsonrpc::make_error(id, jsonrpc::kInvalidParams,
                                   "Invalid params: tools/call requires a string 'name'");
    }
    const std::string name = params["name"].get<std::string>();
    json arguments = params.value("arguments", json::object());
    if (arguments.is_null()) {
        arguments = json::object();
    }
    if (!arguments.is_object()) {
        return jsonrpc::make_error(id, jsonrpc::kInvalidParams,
                                   "Invalid params: 'arguments' must be an object");
    }

    auto result = router_.call_tool(name, arguments);
    if (core::errors::is_error(result)) {
        const auto& error = core::errors::get_error(result);
        LOG_WARN("Tool '" + name + "' failed [" + error.code + "]: " + error.message);
        return jsonrpc::make_error(id, jsonrpc::error_code_for(error), error.message, error.data);
    }
    return jsonrpc::make_result(id, protocol::to_json(core::errors::get_value(result)));
}

json StdioServer::initialize_result() const {
    return json{{"protocolVersion", config_.protocol_version},
                {"capabilities", {{"tools", {{"listChanged", true}}}}},
                {"serverInfo",
                 {{"name", core::config::kServerName},
                  {"version", core::config::kServerVersion}}},
                {"instructions", kInstructions}};
}

void StdioServer::notify_tools_list_changed() {
    if (!client_initialized_.load()) {
        LOG_DEBUG("Client not initialized yet; skipping tools/list_changed");
        return;
    }
    LOG_INFO("Notifying client that the tool list changed");
    write_message(jsonrpc::make_notification("notifications/tools/list_changed"));
}

void StdioServer::write_message(const json& message) {
    const std::string line = message.dump(-1, ' ', false, json::error_handler_t::replace);
    std::lock_guard<std::mutex> lock(write_mutex_);
    out_ << line << '\n';
    out_.flush();
}

}  // namespace wrapmcp::server
