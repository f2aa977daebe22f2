#pragma once

#include <cstddef>
#include <mutex>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/errors/wrap_errors.hpp"
#include "logstore/log_store.hpp"
#include "protocol/tool_contract.hpp"
#include "wrappee/wrappee_transport.hpp"

namespace wrapmcp::proxy {

// Keeps the wrappee's advertised tools and forwards calls to it, recording
// each call in the log store as one request entry plus one terminal entry
// (response or error).
class ToolProxy {
public:
    explicit ToolProxy(logstore::LogStore& log_store);

    // Replaces the cached wrappee tools. On failure the cache is unchanged.
    core::errors::Result<std::size_t> discover(wrappee::WrappeeTransport& transport);

    // Wrappee tools followed by the built-ins.
    std::vector<protocol::ToolDescriptor> all_tools() const;
    std::vector<protocol::ToolDescriptor> wrappee_tools() const;
    void clear_tools();

    // `transport` may be null when no wrappee is running.
    core::errors::Result<protocol::CallToolResult> call(const std::string& name,
                                                        const nlohmann::json& arguments,
                                                        wrappee::WrappeeTransport* transport);

private:
    logstore::LogStore& log_store_;
    mutable std::mutex tools_mutex_;
    std::vector<protocol::ToolDescriptor> tools_;
};

}  // namespace wrapmcp::proxy
