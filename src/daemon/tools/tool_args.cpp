#include "tools/tool_args.hpp"

#include "tools/tool_error.hpp"

#include <cmath>
#include <limits>

bool optional_bool(const nlohmann::json& args, const std::string& name, bool fallback) {
    if (!args.is_object() || !args.contains(name) || args[name].is_null()) return fallback;
    const auto& v = args[name];
    if (!v.is_boolean()) {
        throw ToolError(ToolErrorKind::InvalidParams,
                        "Parameter '" + name + "' must be a boolean");
    }
    return v.get<bool>();
}

int optional_int(const nlohmann::json& args, const std::string& name, int fallback) {
    if (!args.is_object() || !args.contains(name) || args[name].is_null()) return fallback;
    const auto& v = args[name];
    if (v.is_number_integer()) {
        auto n = v.get<int64_t>();
        if (n < std::numeric_limits<int>::min() || n > std::numeric_limits<int>::max()) {
            throw ToolError(ToolErrorKind::InvalidParams,
                            "Parameter '" + name + "' is out of range");
        }
        return static_cast<int>(n);
    }
    if (v.is_number_float()) {
        double d = v.get<double>();
        if (!std::isfinite(d) || d != std::floor(d)) {
            throw ToolError(ToolErrorKind::InvalidParams,
                            "Parameter '" + name + "' must be an integer");
        }
        if (d < std::numeric_limits<int>::min() || d > std::numeric_limits<int>::max()) {
            throw ToolError(ToolErrorKind::InvalidParams,
                            "Parameter '" + name + "' is out of range");
        }
        return static_cast<int>(d);
    }
    throw ToolError(ToolErrorKind::InvalidParams,
                    "Parameter '" + name + "' must be a number");
}
