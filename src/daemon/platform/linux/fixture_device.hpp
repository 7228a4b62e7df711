#pragma once

#include "platform/screen_capture.hpp"
#include "platform/screen_metadata.hpp"
#include "platform/ui_introspection.hpp"

#include <expected>
#include <nlohmann/json.hpp>
#include <string>

// File-backed device: a JSON UI snapshot plus an optional screen image in
// any format QImageReader handles (PPM and PNG are built in).
// Both files are re-read on every call so they can be swapped while running.
class FixtureDevice : public UiIntrospection, public ScreenCapture, public ScreenMetadata {
public:
    FixtureDevice(std::string snapshot_path, std::string screenshot_path);

    // UiIntrospection
    bool is_ready() const override;
    std::vector<RawWindow> list_windows() const override;
    std::expected<Node, std::string> resolve_root(int window_id) const override;
    std::expected<Node, std::string> resolve_active_root() const override;
    std::optional<std::string> active_package() const override;
    std::optional<std::string> active_activity() const override;

    // ScreenCapture
    bool is_available() const override;
    std::expected<QImage, std::string> capture_resized(int max_width, int max_height) override;

    // ScreenMetadata
    ScreenInfo current_screen_info() const override;

    // Exposed for tests. parent_id is the generated id of the parent node.
    static std::expected<Node, std::string> parse_node(const nlohmann::json& j, int depth, int index,
                                                       const std::string& parent_id);

private:
    std::expected<nlohmann::json, std::string> load() const;

    std::string snapshot_path_;
    std::string screenshot_path_;
};
