#include "platform/linux/fixture_device.hpp"

#include "image/scaling.hpp"
#include "model/node_id.hpp"

#include <QImageReader>
#include <QString>

#include <algorithm>
#include <cstdint>
#include <format>
#include <fstream>
#include <limits>
#include <print>

using json = nlohmann::json;

namespace {

std::optional<std::string> opt_string(const json& j, const char* key) {
    if (j.contains(key) && j[key].is_string()) return j[key].get<std::string>();
    return std::nullopt;
}

bool flag(const json& j, const char* key, bool fallback) {
    if (j.contains(key) && j[key].is_boolean()) return j[key].get<bool>();
    return fallback;
}

// Integral JSON number that fits in an int. Floats and out-of-range values fail.
std::optional<int> as_int(const json& v) {
    if (v.is_number_unsigned()) {
        auto u = v.get<uint64_t>();
        if (u > static_cast<uint64_t>(std::numeric_limits<int>::max())) return std::nullopt;
        return static_cast<int>(u);
    }
    if (!v.is_number_integer()) return std::nullopt;
    auto i = v.get<int64_t>();
    if (i < std::numeric_limits<int>::min() || i > std::numeric_limits<int>::max()) return std::nullopt;
    return static_cast<int>(i);
}

std::optional<int> int_field(const json& j, const char* key) {
    if (!j.contains(key)) return std::nullopt;
    return as_int(j[key]);
}

} // namespace

FixtureDevice::FixtureDevice(std::string snapshot_path, std::string screenshot_path)
    : snapshot_path_(std::move(snapshot_path)), screenshot_path_(std::move(screenshot_path)) {}

std::expected<json, std::string> FixtureDevice::load() const {
    if (snapshot_path_.empty()) return std::unexpected("no snapshot file configured");

    std::ifstream f(snapshot_path_);
    if (!f.is_open()) return std::unexpected("cannot open " + snapshot_path_);

    try {
        auto j = json::parse(f);
        if (!j.is_object()) return std::unexpected("snapshot root must be an object");
        return j;
    } catch (const json::exception& e) {
        return std::unexpected(std::format("{}: {}", snapshot_path_, e.what()));
    }
}

std::expected<Node, std::string> FixtureDevice::parse_node(const json& j, int depth, int index,
                                                           const std::string& parent_id) {
    if (!j.is_object()) return std::unexpected("node must be an object");

    Node node;
    try {
        node.class_name = j.value("className", std::string{});
        node.text = opt_string(j, "text");
        node.content_description = opt_string(j, "contentDescription");
        node.resource_id = opt_string(j, "resourceId");

        if (j.contains("bounds")) {
            auto& b = j["bounds"];
            if (!b.is_array() || b.size() != 4) {
                return std::unexpected("bounds must be [left, top, right, bottom]");
            }
            int coords[4];
            for (size_t i = 0; i < 4; i++) {
                auto v = as_int(b[i]);
                if (!v) return std::unexpected(std::format("bounds[{}] must be an integer in int range", i));
                coords[i] = *v;
            }
            node.bounds = Bounds{coords[0], coords[1], coords[2], coords[3]};
        }
    } catch (const json::exception& e) {
        return std::unexpected(std::string("bad node: ") + e.what());
    }

    node.clickable = flag(j, "clickable", false);
    node.long_clickable = flag(j, "longClickable", false);
    node.scrollable = flag(j, "scrollable", false);
    node.editable = flag(j, "editable", false);
    node.enabled = flag(j, "enabled", true);
    node.visible = flag(j, "visible", true);
    node.focusable = flag(j, "focusable", false);

    if (auto id = opt_string(j, "id"); id && !id->empty()) {
        node.id = *id;
    } else {
        node.id = generate_node_id(node.resource_id.value_or(""), node.class_name,
                                   node.bounds, depth, index, parent_id);
    }

    if (j.contains("children")) {
        if (!j["children"].is_array()) return std::unexpected("children must be an array");
        int i = 0;
        for (auto& c : j["children"]) {
            auto child = parse_node(c, depth + 1, i++, node.id);
            if (!child) return child;
            node.children.push_back(std::move(*child));
        }
    }
    return node;
}

bool FixtureDevice::is_ready() const {
    auto j = load();
    if (!j) return false;
    return flag(*j, "ready", true);
}

std::vector<RawWindow> FixtureDevice::list_windows() const {
    std::vector<RawWindow> out;
    auto j = load();
    if (!j) {
        std::println(stderr, "device: {}", j.error());
        return out;
    }
    if (!j->contains("windows") || !(*j)["windows"].is_array()) return out;

    for (auto& w : (*j)["windows"]) {
        if (!w.is_object()) continue;
        auto id = int_field(w, "id");
        if (!id) continue;
        out.push_back(RawWindow{
            .id = *id,
            .type_raw = w.value("type", std::string{}),
            .title = opt_string(w, "title"),
            .package_name = opt_string(w, "package"),
            .activity_name = opt_string(w, "activity"),
            .layer = int_field(w, "layer").value_or(0),
            .focused = flag(w, "focused", false),
        });
    }
    return out;
}

std::expected<Node, std::string> FixtureDevice::resolve_root(int window_id) const {
    auto j = load();
    if (!j) return std::unexpected(j.error());
    if (!j->contains("windows") || !(*j)["windows"].is_array()) {
        return std::unexpected("no windows in snapshot");
    }

    for (auto& w : (*j)["windows"]) {
        if (!w.is_object() || int_field(w, "id") != window_id) continue;
        if (!w.contains("root") || w["root"].is_null()) {
            return std::unexpected(std::format("window {} has no root node", window_id));
        }
        return parse_node(w["root"], 0, 0, std::string(kRootParentId));
    }
    return std::unexpected(std::format("window {} not found", window_id));
}

std::expected<Node, std::string> FixtureDevice::resolve_active_root() const {
    auto j = load();
    if (!j) return std::unexpected(j.error());

    if (j->contains("active") && (*j)["active"].is_object()) {
        auto& active = (*j)["active"];
        if (active.contains("root") && !active["root"].is_null()) {
            return parse_node(active["root"], 0, 0, std::string(kRootParentId));
        }
        return std::unexpected("active window has no root node");
    }

    // Fall back to the focused window, then the first one.
    auto windows = list_windows();
    if (windows.empty()) return std::unexpected("no active window");
    auto it = std::ranges::find_if(windows, [](const RawWindow& w) { return w.focused; });
    return resolve_root(it != windows.end() ? it->id : windows.front().id);
}

std::optional<std::string> FixtureDevice::active_package() const {
    auto j = load();
    if (!j || !j->contains("active") || !(*j)["active"].is_object()) return std::nullopt;
    return opt_string((*j)["active"], "package");
}

std::optional<std::string> FixtureDevice::active_activity() const {
    auto j = load();
    if (!j || !j->contains("active") || !(*j)["active"].is_object()) return std::nullopt;
    return opt_string((*j)["active"], "activity");
}

bool FixtureDevice::is_available() const {
    if (screenshot_path_.empty()) return false;
    std::ifstream f(screenshot_path_, std::ios::binary);
    return f.is_open();
}

std::expected<QImage, std::string> FixtureDevice::capture_resized(int max_width, int max_height) {
    if (max_width <= 0 || max_height <= 0) {
        return std::unexpected("capture size must be positive");
    }
    QImageReader reader(QString::fromStdString(screenshot_path_));
    QImage image = reader.read();
    if (image.isNull()) {
        return std::unexpected(std::format("{}: {}", screenshot_path_, reader.errorString().toStdString()));
    }
    return scaled_to_fit(image, max_width, max_height);
}

ScreenInfo FixtureDevice::current_screen_info() const {
    ScreenInfo info;
    auto j = load();
    if (!j || !j->contains("screen") || !(*j)["screen"].is_object()) return info;

    auto& s = (*j)["screen"];
    auto width = int_field(s, "width");
    auto height = int_field(s, "height");
    auto density = int_field(s, "densityDpi");
    if (!width || !height || !density) {
        std::println(stderr, "device: screen width, height and densityDpi must be integers");
        return info;
    }
    info.width = *width;
    info.height = *height;
    info.density_dpi = *density;

    auto orientation = opt_string(s, "orientation");
    if (orientation) {
        info.orientation = *orientation == "landscape" ? Orientation::Landscape : Orientation::Portrait;
    } else {
        info.orientation = info.width > info.height ? Orientation::Landscape : Orientation::Portrait;
    }
    return info;
}
