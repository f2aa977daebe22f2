#pragma once
#include <cstdint>
#include <string>
#include <nlohmann/json.hpp>
#include "core/errors/wrap_errors.hpp"

namespace wrapmcp::protocol::jsonrpc {

    // Standard JSON-RPC 2.0 error codes
    inline constexpr int kParseError = -32700;
    inline constexpr int kInvalidRequest = -32600;
    inline constexpr int kMethodNotFound = -32601;
    inline constexpr int kInvalidParams = -32602;
    inline constexpr int kInternalError = -32603;

    // Fixed downstream ids: exactly one request is outstanding per transport.
    inline constexpr std::int64_t kInitializeId = 1;
    inline constexpr std::int64_t kListToolsId = 2;
    inline constexpr std::int64_t kCallToolId = 3;

    inline nlohmann::json make_request(std::int64_t id, const std::string& method,
                                       const nlohmann::json& params) {
        return nlohmann::json{{"jsonrpc", "2.0"}, {"id", id}, {"method", method}, {"params", params}};
    }

    inline nlohmann::json make_notification(const std::string& method) {
        return nlohmann::json{{"jsonrpc", "2.0"}, {"method", method}};
    }

    inline nlohmann::json make_result(const nlohmann::json& id, const nlohmann::json& result) {
        return nlohmann::json{{"jsonrpc", "2.0"}, {"id", id}, {"result", result}};
    }

    inline nlohmann::json make_error(const nlohmann::json& id, int code,
                                     const std::string& message,
                                     const nlohmann::json& data = nullptr) {
        nlohmann::json error{{"code", code}, {"message", message}};
        if (!data.is_null()) {
            error["data"] = data;
        }
        return nlohmann::json{{"jsonrpc", "2.0"}, {"id", id}, {"error", error}};
    }

    // Upstream error code for a wrapper error
    inline int error_code_for(const core::errors::WrapError& error) {
        return error.kind == core::errors::ErrorKind::Input ? kInvalidParams : kInternalError;
    }

} // namespace wrapmcp::protocol::jsonrpc
