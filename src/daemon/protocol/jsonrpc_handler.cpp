#include "protocol/jsonrpc_handler.hpp"

#include "protocol/content.hpp"

#include <chrono>

using json = nlohmann::json;

namespace jsonrpc {

json error_response(const json& id, int code, const std::string& message) {
    return {{"jsonrpc", kVersion}, {"id", id}, {"error", {{"code", code}, {"message", message}}}};
}

json result_response(const json& id, json result) {
    return {{"jsonrpc", kVersion}, {"id", id}, {"result", std::move(result)}};
}

} // namespace jsonrpc

JsonRpcHandler::JsonRpcHandler(const ToolRegistry& registry, std::string server_version,
                               ToolCallObserver observer)
    : registry_(registry), server_version_(std::move(server_version)),
      observer_(std::move(observer)) {}

std::optional<json> JsonRpcHandler::handle_text(const std::string& body) const {
    json request;
    try {
        request = json::parse(body);
    } catch (const json::exception&) {
        return jsonrpc::error_response(nullptr, jsonrpc::kParseError, "Parse error: invalid JSON");
    }
    return handle(request);
}

std::optional<json> JsonRpcHandler::handle(const json& request) const {
    if (!request.is_object()) {
        return jsonrpc::error_response(nullptr, jsonrpc::kInvalidRequest, "Invalid request");
    }

    json id = request.contains("id") ? request["id"] : json(nullptr);

    if (!request.contains("jsonrpc") || request["jsonrpc"] != jsonrpc::kVersion) {
        return jsonrpc::error_response(id, jsonrpc::kInvalidRequest,
                                       "Unsupported JSON-RPC version");
    }
    if (!request.contains("method") || !request["method"].is_string()) {
        return jsonrpc::error_response(id, jsonrpc::kInvalidRequest, "Invalid request");
    }

    auto method = request["method"].get<std::string>();

    if (!request.contains("id") && method.starts_with("notifications/")) {
        return std::nullopt;
    }

    if (method == "initialize") return jsonrpc::result_response(id, initialize_result());
    if (method == "tools/list") return jsonrpc::result_response(id, tools_list_result());
    if (method == "ping") return jsonrpc::result_response(id, json::object());

    if (method == "tools/call") {
        if (!request.contains("params") || !request["params"].is_object()) {
            return jsonrpc::error_response(id, jsonrpc::kInvalidParams,
                                           "Missing params for tools/call");
        }
        return call_tool(id, request["params"]);
    }

    return jsonrpc::error_response(id, jsonrpc::kMethodNotFound, "Method not found: " + method);
}

json JsonRpcHandler::initialize_result() const {
    return {
        {"protocolVersion", jsonrpc::kProtocolVersion},
        {"serverInfo", {{"name", jsonrpc::kServerName}, {"version", server_version_}}},
        {"capabilities", {{"tools", {{"listChanged", false}}}}},
    };
}

json JsonRpcHandler::tools_list_result() const {
    json tools = json::array();
    for (const auto* def : registry_.list()) {
        tools.push_back({
            {"name", def->name},
            {"description", def->description},
            {"inputSchema", def->input_schema},
        });
    }
    return {{"tools", std::move(tools)}};
}

json JsonRpcHandler::call_tool(const json& id, const json& params) const {
    if (!params.contains("name") || !params["name"].is_string()) {
        return jsonrpc::error_response(id, jsonrpc::kInvalidParams, "Missing 'name' in params");
    }
    auto name = params["name"].get<std::string>();
    json arguments = params.contains("arguments") ? params["arguments"] : json(nullptr);

    auto start = std::chrono::steady_clock::now();
    auto result = registry_.dispatch(name, arguments);
    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start).count();

    if (observer_) observer_(name, arguments, result, elapsed);

    return jsonrpc::result_response(id, to_json(result));
}
