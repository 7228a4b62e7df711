#pragma once

#include "model/node.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

enum class WindowType {
    Application,
    System,
    InputMethod,
    AccessibilityOverlay,
    Other,
};

// Upper-case name used in the compact output header, e.g. "INPUT_METHOD".
std::string_view window_type_name(WindowType type);

// Accepts "APPLICATION", "application", "input-method", "TYPE_INPUT_METHOD", ...
// Anything unrecognized maps to WindowType::Other.
WindowType parse_window_type(std::string_view raw);

struct WindowData {
    int window_id = 0;
    WindowType window_type = WindowType::Other;
    std::optional<std::string> package_name;
    std::optional<std::string> title;
    std::optional<std::string> activity_name;
    int layer = 0;
    bool focused = false;
    Node tree;
};

enum class Orientation { Portrait, Landscape };

struct ScreenInfo {
    int width = 0;
    int height = 0;
    int density_dpi = 0;
    Orientation orientation = Orientation::Portrait;
};

std::string_view orientation_name(Orientation o);

struct Snapshot {
    std::vector<WindowData> windows;
    bool degraded = false;
};
