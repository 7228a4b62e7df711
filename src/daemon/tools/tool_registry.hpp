#pragma once

#include "protocol/content.hpp"

#include <functional>
#include <map>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

struct ToolDefinition {
    using Handler = std::function<ToolResult(const nlohmann::json& arguments)>;

    std::string name;
    std::string description;
    nlohmann::json input_schema;
    Handler handler;
};

// Name -> tool table. Filled once at startup, then only read, so dispatch may
// run on several worker threads at once.
class ToolRegistry {
public:
    explicit ToolRegistry(bool verbose = false);

    // Throws std::logic_error on a duplicate name.
    void register_tool(std::string name, std::string description,
                       nlohmann::json input_schema, ToolDefinition::Handler handler);

    // Never throws. Unknown names, ToolError and any other exception all come
    // back as an is_error result.
    ToolResult dispatch(const std::string& name, const nlohmann::json& arguments) const;

    bool contains(const std::string& name) const { return tools_.contains(name); }
    size_t size() const { return tools_.size(); }

    // Sorted by name.
    std::vector<const ToolDefinition*> list() const;

private:
    void log(const std::string& msg) const;

    std::map<std::string, ToolDefinition> tools_;
    bool verbose_;
};
