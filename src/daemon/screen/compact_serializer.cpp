#include "screen/compact_serializer.hpp"

#include <format>

namespace {

std::string sanitize(std::string_view raw) {
    std::string s(raw);
    for (char& c : s) {
        if (c == '\t' || c == '\n' || c == '\r') c = ' ';
    }
    auto start = s.find_first_not_of(" \f\v");
    if (start == std::string::npos) return {};
    auto end = s.find_last_not_of(" \f\v");
    return s.substr(start, end - start + 1);
}

bool non_empty(const std::optional<std::string>& s) {
    return s && !s->empty();
}

} // namespace

std::string CompactSerializer::serialize(const Snapshot& snapshot, const ScreenInfo& screen) const {
    std::string out;

    for (auto line : kLegendLines) {
        out += line;
        out += '\n';
    }

    out += std::format("screen:{}x{} density:{} orientation:{}\n",
                       screen.width, screen.height, screen.density_dpi,
                       orientation_name(screen.orientation));

    if (snapshot.degraded) {
        out += kDegradedLine;
        out += '\n';
    }

    for (const auto& w : snapshot.windows) {
        out += std::format("--- window:{} type:{}\n", w.window_id, window_type_name(w.window_type));
        out += "pkg:";
        out += sanitize_resource_id(w.package_name);
        out += '\n';
        if (non_empty(w.activity_name)) {
            out += "activity:";
            out += sanitize_resource_id(w.activity_name);
            out += '\n';
        }
        out += kColumnHeader;
        out += '\n';
        append_rows(out, w.tree);
    }

    while (!out.empty() && out.back() == '\n') out.pop_back();
    return out;
}

void CompactSerializer::append_rows(std::string& out, const Node& node) const {
    if (should_keep(node)) {
        out += std::format("{}\t{}\t{}\t{}\t{}\t{},{},{},{}\t{}\n",
                           node.id,
                           simplify_class_name(node.class_name),
                           sanitize_text(node.text),
                           sanitize_text(node.content_description),
                           sanitize_resource_id(node.resource_id),
                           node.bounds.left, node.bounds.top,
                           node.bounds.right, node.bounds.bottom,
                           build_flags(node));
    }
    for (const auto& child : node.children) {
        append_rows(out, child);
    }
}

std::vector<AnnotationTarget> CompactSerializer::annotation_targets(const Snapshot& snapshot) const {
    std::vector<AnnotationTarget> out;
    for (const auto& w : snapshot.windows) {
        collect_targets(out, w.tree);
    }
    return out;
}

void CompactSerializer::collect_targets(std::vector<AnnotationTarget>& out, const Node& node) const {
    if (should_keep(node) && node.visible) {
        out.push_back({node.id, node.bounds});
    }
    for (const auto& child : node.children) {
        collect_targets(out, child);
    }
}

bool CompactSerializer::should_keep(const Node& node) {
    return non_empty(node.text) ||
           non_empty(node.content_description) ||
           non_empty(node.resource_id) ||
           node.clickable ||
           node.long_clickable ||
           node.scrollable ||
           node.editable;
}

std::string CompactSerializer::simplify_class_name(std::string_view class_name) {
    if (class_name.empty()) return std::string(kNullValue);
    auto dot = class_name.rfind('.');
    auto simple = dot == std::string_view::npos ? class_name : class_name.substr(dot + 1);
    auto s = sanitize(simple);
    return s.empty() ? std::string(kNullValue) : s;
}

std::string CompactSerializer::sanitize_text(const std::optional<std::string>& text) {
    if (!text) return std::string(kNullValue);
    auto s = sanitize(*text);
    if (s.empty()) return std::string(kNullValue);
    return truncate_utf8(s, kMaxTextLength);
}

std::string CompactSerializer::sanitize_resource_id(const std::optional<std::string>& resource_id) {
    if (!resource_id) return std::string(kNullValue);
    auto s = sanitize(*resource_id);
    return s.empty() ? std::string(kNullValue) : s;
}

std::string CompactSerializer::build_flags(const Node& node) {
    std::string flags = node.visible ? "on" : "off";
    if (node.clickable) flags += ",clk";
    if (node.long_clickable) flags += ",lclk";
    if (node.scrollable) flags += ",scr";
    if (node.editable) flags += ",edt";
    if (node.enabled) flags += ",ena";
    if (node.focusable) flags += ",foc";
    return flags;
}

std::string CompactSerializer::truncate_utf8(std::string_view s, size_t max_chars) {
    size_t chars = 0;
    for (size_t i = 0; i < s.size(); i++) {
        // Count lead bytes only; continuation bytes are 10xxxxxx.
        if ((static_cast<unsigned char>(s[i]) & 0xC0) != 0x80) {
            if (chars == max_chars) return std::string(s.substr(0, i));
            chars++;
        }
    }
    return std::string(s);
}
