#include "screen/snapshot_normalizer.hpp"

#include <format>
#include <print>

namespace {

WindowData make_window(const RawWindow& raw, Node root) {
    return WindowData{
        .window_id = raw.id,
        .window_type = parse_window_type(raw.type_raw),
        .package_name = raw.package_name,
        .title = raw.title,
        .activity_name = raw.activity_name,
        .layer = raw.layer,
        .focused = raw.focused,
        .tree = std::move(root),
    };
}

} // namespace

std::expected<Snapshot, ToolError> SnapshotNormalizer::normalize(const UiIntrospection& source) const {
    auto raw_windows = source.list_windows();

    if (raw_windows.size() <= 1) {
        return degraded(source, raw_windows.empty() ? nullptr : &raw_windows.front());
    }

    Snapshot snap;
    snap.windows.reserve(raw_windows.size());
    for (const auto& raw : raw_windows) {
        auto root = source.resolve_root(raw.id);
        if (!root) {
            log(std::format("window {} skipped: {}", raw.id, root.error()));
            continue;
        }
        snap.windows.push_back(make_window(raw, std::move(*root)));
    }

    if (snap.windows.empty()) {
        log("no window resolved, falling back to active root");
        return degraded(source, nullptr);
    }

    snap.degraded = false;
    return snap;
}

std::expected<Snapshot, ToolError> SnapshotNormalizer::degraded(const UiIntrospection& source,
                                                                const RawWindow* only) const {
    std::expected<Node, std::string> root = std::unexpected(std::string("no window"));
    if (only) root = source.resolve_root(only->id);
    if (!root) root = source.resolve_active_root();
    if (!root) {
        std::println(stderr, "screen: root unavailable: {}", root.error());
        return std::unexpected(ToolError(ToolErrorKind::ActionFailed,
                                         "Failed to obtain root accessibility node."));
    }

    WindowData window{
        .window_id = 0,
        .window_type = WindowType::Application,
        .package_name = only && only->package_name ? only->package_name : source.active_package(),
        .title = only ? only->title : std::nullopt,
        .activity_name = only && only->activity_name ? only->activity_name : source.active_activity(),
        .layer = 0,
        .focused = true,
        .tree = std::move(*root),
    };

    Snapshot snap;
    snap.windows.push_back(std::move(window));
    snap.degraded = true;
    return snap;
}

void SnapshotNormalizer::log(const std::string& msg) const {
    if (verbose_) {
        std::println(stderr, "[rcmcp] {}", msg);
    }
}
