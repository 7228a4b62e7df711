#include "tools/screen_tools.hpp"

#include "image/jpeg_encoder.hpp"
#include "tools/tool_args.hpp"
#include "tools/tool_error.hpp"

#include <algorithm>
#include <format>
#include <print>

using json = nlohmann::json;

namespace {

constexpr int kMinDimension = 64;

const char* kNotReady =
    "Accessibility service not enabled or not ready. "
    "Please enable it in Android Settings > Accessibility.";
const char* kCaptureUnavailable =
    "Screen capture not available. Please enable the accessibility service in Android Settings.";

json empty_object_schema() {
    return {{"type", "object"}, {"properties", json::object()}, {"required", json::array()}};
}

} // namespace

ScreenTools::ScreenTools(UiIntrospection& ui, ScreenCapture& capture, ScreenMetadata& metadata,
                         ScreenToolOptions options)
    : ui_(ui), capture_(capture), metadata_(metadata), options_(options),
      normalizer_(options.verbose) {}

void ScreenTools::register_all(ToolRegistry& registry) {
    registry.register_tool(
        "get_screen_state",
        "Returns the current screen state: app info, screen dimensions, and a compact UI "
        "element list per window (text/desc truncated to 100 chars). Optionally includes a "
        "low-resolution annotated screenshot (only request it when the element list alone "
        "is not sufficient to understand the layout).",
        {
            {"type", "object"},
            {"properties", {
                {"include_screenshot", {
                    {"type", "boolean"},
                    {"description", "Include a low-resolution screenshot. "
                                    "Only request when the UI element list is not sufficient."},
                    {"default", false},
                }},
                {"max_dimension", {
                    {"type", "integer"},
                    {"description", "Longest screenshot side in pixels (capped by the server)."},
                    {"minimum", kMinDimension},
                }},
            }},
            {"required", json::array()},
        },
        [this](const json& args) { return get_screen_state(args); });

    registry.register_tool(
        "get_screen_info",
        "Returns screen width, height, density and orientation as JSON.",
        empty_object_schema(),
        [this](const json& args) { return get_screen_info(args); });

    registry.register_tool(
        "list_windows",
        "Lists the on-screen windows with id, type, layer, focus and package.",
        empty_object_schema(),
        [this](const json& args) { return list_windows(args); });
}

ToolResult ScreenTools::get_screen_state(const json& arguments) {
    // Arguments first, before any expensive work.
    bool include_screenshot = optional_bool(arguments, "include_screenshot", false);
    int max_dimension = optional_int(arguments, "max_dimension", options_.max_dimension);
    if (max_dimension < kMinDimension) {
        throw ToolError(ToolErrorKind::InvalidParams,
                        std::format("Parameter 'max_dimension' must be at least {}", kMinDimension));
    }
    max_dimension = std::min(max_dimension, options_.max_dimension);

    require_ready();

    auto snapshot = normalizer_.normalize(ui_);
    if (!snapshot) throw snapshot.error();

    auto screen = metadata_.current_screen_info();
    auto text = serializer_.serialize(*snapshot, screen);

    log(std::format("get_screen_state: windows={} degraded={} screenshot={}",
                    snapshot->windows.size(), snapshot->degraded, include_screenshot));

    if (!include_screenshot) {
        return make_screen_result(std::move(text), std::nullopt);
    }
    auto image = capture_annotated(*snapshot, screen, max_dimension);
    return make_screen_result(std::move(text), std::move(image));
}

EncodedImage ScreenTools::capture_annotated(const Snapshot& snapshot, const ScreenInfo& screen,
                                            int max_dimension) {
    if (!capture_.is_available()) {
        throw ToolError(ToolErrorKind::PermissionDenied, kCaptureUnavailable);
    }

    auto resized = capture_.capture_resized(max_dimension, max_dimension);
    if (!resized) {
        std::println(stderr, "screen: capture failed: {}", resized.error());
        throw ToolError(ToolErrorKind::ActionFailed, "Screenshot capture failed");
    }

    auto targets = serializer_.annotation_targets(snapshot);
    auto annotated = annotator_.annotate(*resized, targets, screen.width, screen.height);
    if (!annotated) {
        std::println(stderr, "screen: annotation failed: {}", annotated.error().message);
        throw ToolError(ToolErrorKind::ActionFailed, "Screenshot annotation failed");
    }

    auto jpeg_bytes = jpeg::encode(*annotated, options_.jpeg_quality);
    if (!jpeg_bytes) {
        std::println(stderr, "screen: encoding failed: {}", jpeg_bytes.error());
        throw ToolError(ToolErrorKind::ActionFailed, "Screenshot encoding failed");
    }

    return EncodedImage{.data_base64 = jpeg_bytes->toBase64().toStdString(), .mime_type = "image/jpeg"};
}

ToolResult ScreenTools::get_screen_info(const json& /*arguments*/) {
    require_ready();
    auto s = metadata_.current_screen_info();
    json j = {
        {"width", s.width},
        {"height", s.height},
        {"densityDpi", s.density_dpi},
        {"orientation", std::string(orientation_name(s.orientation))},
    };
    return text_result(j.dump());
}

ToolResult ScreenTools::list_windows(const json& /*arguments*/) {
    require_ready();

    auto snapshot = normalizer_.normalize(ui_);
    if (!snapshot) throw snapshot.error();

    std::string out;
    if (snapshot->degraded) {
        out += kDegradedLine;
        out += '\n';
    }
    for (const auto& w : snapshot->windows) {
        out += std::format("window:{} type:{} layer:{} focused:{} pkg:{} title:{}\n",
                           w.window_id, window_type_name(w.window_type), w.layer, w.focused,
                           CompactSerializer::sanitize_resource_id(w.package_name),
                           CompactSerializer::sanitize_text(w.title));
    }
    if (!out.empty()) out.pop_back();
    return text_result(std::move(out));
}

void ScreenTools::require_ready() const {
    if (!ui_.is_ready()) {
        throw ToolError(ToolErrorKind::PermissionDenied, kNotReady);
    }
}

void ScreenTools::log(const std::string& msg) const {
    if (options_.verbose) {
        std::println(stderr, "[rcmcp] {}", msg);
    }
}
