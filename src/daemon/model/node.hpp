#pragma once

#include <optional>
#include <string>
#include <vector>

// Pixel rectangle in screen coordinates. May be degenerate.
struct Bounds {
    int left = 0;
    int top = 0;
    int right = 0;
    int bottom = 0;

    int width() const { return right - left; }
    int height() const { return bottom - top; }

    bool operator==(const Bounds&) const = default;
};

struct Node {
    std::string id;
    std::string class_name;
    std::optional<std::string> text;
    std::optional<std::string> content_description;
    std::optional<std::string> resource_id;
    Bounds bounds;

    bool clickable = false;
    bool long_clickable = false;
    bool scrollable = false;
    bool editable = false;
    bool enabled = false;
    bool visible = false;
    bool focusable = false;

    std::vector<Node> children;
};
