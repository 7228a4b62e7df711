#pragma once

#include "model/window.hpp"

#include <array>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

inline constexpr size_t kMaxTextLength = 100;
inline constexpr std::string_view kNullValue = "-";
inline constexpr std::string_view kColumnHeader = "id\tclass\ttext\tdesc\tres_id\tbounds\tflags";

// Pinned wording; clients parse these lines.
inline constexpr std::array<std::string_view, 3> kLegendLines = {
    "note:structural-only nodes are omitted from the tree",
    "note:flags legend: on=onscreen off=offscreen clk=clickable lclk=longClickable "
    "scr=scrollable edt=editable ena=enabled foc=focusable",
    "note:offscreen items require scroll_to_element before interaction",
};
inline constexpr std::string_view kDegradedLine =
    "note:DEGRADED multi-window unavailable, showing active window only";

struct AnnotationTarget {
    std::string id;
    Bounds bounds;
};

// Snapshot + screen metadata -> compact TSV document. Output is a pure
// function of the input.
class CompactSerializer {
public:
    std::string serialize(const Snapshot& snapshot, const ScreenInfo& screen) const;

    // Kept nodes that are also visible, pre-order, windows in snapshot order.
    std::vector<AnnotationTarget> annotation_targets(const Snapshot& snapshot) const;

    static bool should_keep(const Node& node);
    static std::string simplify_class_name(std::string_view class_name);
    static std::string sanitize_text(const std::optional<std::string>& text);
    static std::string sanitize_resource_id(const std::optional<std::string>& resource_id);
    static std::string build_flags(const Node& node);

    // First max_chars code points of a UTF-8 string.
    static std::string truncate_utf8(std::string_view s, size_t max_chars);

private:
    void append_rows(std::string& out, const Node& node) const;
    void collect_targets(std::vector<AnnotationTarget>& out, const Node& node) const;
};
