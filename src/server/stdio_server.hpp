#pragma once

#include <atomic>
#include <iosfwd>
#include <mutex>
#include <string>
#include <nlohmann/json.hpp>
#include "core/config/wrap_config.hpp"
#include "server/tool_router.hpp"

namespace wrapmcp::server {

// The wrapper's own MCP endpoint: one JSON-RPC message per line on `in`,
// replies on `out`. Output is shared with the watcher thread, which emits
// tools/list_changed notifications, so every write takes the same lock.
class StdioServer {
public:
    StdioServer(ToolRouter& router, const core::config::WrapConfig& config, std::istream& in,
                std::ostream& out);

    // Serves until `in` reaches end of file.
    void run();

    // Handles one raw line; returns the reply, or null when none is due.
    nlohmann::json handle_line(const std::string& line);
    nlohmann::json handle_message(const nlohmann::json& message);

    // Sent only after the client has completed its handshake.
    void notify_tools_list_changed();
    bool client_initialized() const { return client_initialized_.load(); }

private:
    nlohmann::json handle_request(const nlohmann::json& id, const std::string& method,
                                  const nlohmann::json& params);
    nlohmann::json handle_tools_call(const nlohmann::json& id, const nlohmann::json& params);
    nlohmann::json initialize_result() const;
    void write_message(const nlohmann::json& message);

    ToolRouter& router_;
    const core::config::WrapConfig& config_;
    std::istream& in_;
    std::ostream& out_;
    std::mutex write_mutex_;
    std::atomic_bool client_initialized_{false};
};

}  // namespace wrapmcp::server
