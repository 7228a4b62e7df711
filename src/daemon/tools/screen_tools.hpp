#pragma once

#include "platform/screen_capture.hpp"
#include "platform/screen_metadata.hpp"
#include "platform/ui_introspection.hpp"
#include "protocol/content.hpp"
#include "screen/annotator.hpp"
#include "screen/compact_serializer.hpp"
#include "screen/snapshot_normalizer.hpp"
#include "tools/tool_registry.hpp"

#include <nlohmann/json.hpp>

struct ScreenToolOptions {
    int max_dimension = 700;
    int jpeg_quality = 80;
    bool verbose = false;
};

// Screen introspection tools: get_screen_state, get_screen_info, list_windows.
// Holds references only; every call builds its own snapshot.
class ScreenTools {
public:
    ScreenTools(UiIntrospection& ui, ScreenCapture& capture, ScreenMetadata& metadata,
                ScreenToolOptions options);

    void register_all(ToolRegistry& registry);

    ToolResult get_screen_state(const nlohmann::json& arguments);
    ToolResult get_screen_info(const nlohmann::json& arguments);
    ToolResult list_windows(const nlohmann::json& arguments);

private:
    void require_ready() const;
    EncodedImage capture_annotated(const Snapshot& snapshot, const ScreenInfo& screen,
                                   int max_dimension);
    void log(const std::string& msg) const;

    UiIntrospection& ui_;
    ScreenCapture& capture_;
    ScreenMetadata& metadata_;
    ScreenToolOptions options_;

    SnapshotNormalizer normalizer_;
    CompactSerializer serializer_;
    ScreenshotAnnotator annotator_;
};
