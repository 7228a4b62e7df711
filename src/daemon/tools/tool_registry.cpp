#include "tools/tool_registry.hpp"

#include "tools/tool_error.hpp"

#include <format>
#include <print>
#include <stdexcept>

const char* tool_error_kind_name(ToolErrorKind kind) {
    switch (kind) {
        case ToolErrorKind::Unauthorized: return "unauthorized";
        case ToolErrorKind::MethodNotFound: return "method_not_found";
        case ToolErrorKind::InvalidParams: return "invalid_params";
        case ToolErrorKind::PermissionDenied: return "permission_denied";
        case ToolErrorKind::ActionFailed: return "action_failed";
        case ToolErrorKind::Timeout: return "timeout";
    }
    return "unknown";
}

ToolRegistry::ToolRegistry(bool verbose) : verbose_(verbose) {}

void ToolRegistry::register_tool(std::string name, std::string description,
                                 nlohmann::json input_schema,
                                 ToolDefinition::Handler handler) {
    if (tools_.contains(name)) {
        throw std::logic_error("tool registered twice: " + name);
    }
    log("Registered tool: " + name);
    auto key = name;
    tools_.emplace(std::move(key), ToolDefinition{
        .name = std::move(name),
        .description = std::move(description),
        .input_schema = std::move(input_schema),
        .handler = std::move(handler),
    });
}

ToolResult ToolRegistry::dispatch(const std::string& name,
                                  const nlohmann::json& arguments) const {
    auto it = tools_.find(name);
    if (it == tools_.end()) {
        return error_result("Unknown tool: " + name);
    }

    try {
        return it->second.handler(arguments);
    } catch (const ToolError& e) {
        log(std::format("Tool {} failed ({}): {}", name, tool_error_kind_name(e.kind()), e.what()));
        return error_result(e.message());
    } catch (const std::exception& e) {
        std::println(stderr, "tools: {} threw: {}", name, e.what());
        return error_result("Tool execution failed");
    } catch (...) {
        std::println(stderr, "tools: {} threw a non-standard exception", name);
        return error_result("Tool execution failed");
    }
}

std::vector<const ToolDefinition*> ToolRegistry::list() const {
    std::vector<const ToolDefinition*> out;
    out.reserve(tools_.size());
    for (auto& [_, def] : tools_) out.push_back(&def);
    return out;
}

void ToolRegistry::log(const std::string& msg) const {
    if (verbose_) {
        std::println(stderr, "[rcmcp] {}", msg);
    }
}
