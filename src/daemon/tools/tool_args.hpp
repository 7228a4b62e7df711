#pragma once

#include <nlohmann/json.hpp>
#include <string>

// Typed accessors for tool arguments. A present value of the wrong JSON type
// throws ToolError(InvalidParams). A null/absent arguments object is fine.
bool optional_bool(const nlohmann::json& args, const std::string& name, bool fallback);
int optional_int(const nlohmann::json& args, const std::string& name, int fallback);
