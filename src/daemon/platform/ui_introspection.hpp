#pragma once

#include "model/node.hpp"

#include <expected>
#include <optional>
#include <string>
#include <vector>

// One window as reported by the introspection source, before its tree is
// resolved. type_raw is whatever the source calls it.
struct RawWindow {
    int id = 0;
    std::string type_raw;
    std::optional<std::string> title;
    std::optional<std::string> package_name;
    std::optional<std::string> activity_name;
    int layer = 0;
    bool focused = false;
};

class UiIntrospection {
public:
    virtual ~UiIntrospection() = default;
    virtual bool is_ready() const = 0;
    // Empty when multi-window enumeration is unavailable.
    virtual std::vector<RawWindow> list_windows() const = 0;
    virtual std::expected<Node, std::string> resolve_root(int window_id) const = 0;
    // Root of the active window only, used in degraded mode.
    virtual std::expected<Node, std::string> resolve_active_root() const = 0;
    virtual std::optional<std::string> active_package() const = 0;
    virtual std::optional<std::string> active_activity() const = 0;
};
