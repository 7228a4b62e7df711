#pragma once

#include "tools/tool_registry.hpp"

#include <cstdint>
#include <functional>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace jsonrpc {

inline constexpr const char* kVersion = "2.0";
inline constexpr const char* kProtocolVersion = "2024-11-05";
inline constexpr const char* kServerName = "rcmcp";

inline constexpr int kParseError = -32700;
inline constexpr int kInvalidRequest = -32600;
inline constexpr int kMethodNotFound = -32601;
inline constexpr int kInvalidParams = -32602;
inline constexpr int kInternalError = -32603;

nlohmann::json error_response(const nlohmann::json& id, int code, const std::string& message);
nlohmann::json result_response(const nlohmann::json& id, nlohmann::json result);

} // namespace jsonrpc

// Observer for completed tools/call requests (name, arguments, result, elapsed ms).
using ToolCallObserver =
    std::function<void(const std::string&, const nlohmann::json&, const ToolResult&, int64_t)>;

// Routes JSON-RPC 2.0 requests to initialize / tools/list / tools/call.
class JsonRpcHandler {
public:
    JsonRpcHandler(const ToolRegistry& registry, std::string server_version,
                   ToolCallObserver observer = {});

    // nullopt for notifications, which get no response body.
    std::optional<nlohmann::json> handle(const nlohmann::json& request) const;

    // Parses body then handles it; parse errors become -32700.
    std::optional<nlohmann::json> handle_text(const std::string& body) const;

    nlohmann::json initialize_result() const;
    nlohmann::json tools_list_result() const;
    // params is the tools/call params object {name, arguments}.
    nlohmann::json call_tool(const nlohmann::json& id, const nlohmann::json& params) const;

private:
    const ToolRegistry& registry_;
    std::string server_version_;
    ToolCallObserver observer_;
};
