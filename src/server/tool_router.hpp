#pragma once

#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/errors/wrap_errors.hpp"
#include "logstore/log_store.hpp"
#include "protocol/tool_contract.hpp"
#include "proxy/tool_proxy.hpp"
#include "supervisor/process_supervisor.hpp"
#include "tools/builtin_tools.hpp"

namespace wrapmcp::server {

// Dispatches upstream tool calls: built-ins are served here, everything
// else goes through the supervisor to the wrappee.
class ToolRouter {
public:
    ToolRouter(supervisor::ProcessSupervisor& supervisor, proxy::ToolProxy& proxy,
               logstore::LogStore& store);

    std::vector<protocol::ToolDescriptor> list_tools() const;

    core::errors::Result<protocol::CallToolResult> call_tool(const std::string& name,
                                                             const nlohmann::json& arguments);

private:
    void register_builtins();
    core::errors::Result<protocol::CallToolResult> restart_wrapped_server(
        const nlohmann::json& arguments);

    supervisor::ProcessSupervisor& supervisor_;
    proxy::ToolProxy& proxy_;
    logstore::LogStore& store_;
    tools::BuiltinRegistry registry_;
};

}  // namespace wrapmcp::server
