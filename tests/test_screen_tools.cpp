#include <catch2/catch_test_macros.hpp>

#include "mock_device.hpp"
#include "tools/screen_tools.hpp"

#include <QByteArray>

using json = nlohmann::json;

namespace {

std::string text_of(const ToolResult& r, size_t i = 0) {
    REQUIRE(r.content.size() > i);
    return std::get<TextContent>(r.content[i]).text;
}

RawWindow window(int id, std::string type, std::string pkg, int layer, bool focused) {
    RawWindow w;
    w.id = id;
    w.type_raw = std::move(type);
    w.package_name = std::move(pkg);
    w.layer = layer;
    w.focused = focused;
    return w;
}

} // namespace

TEST_CASE("Screen tools", "[screen_tools]") {
    MockUi ui;
    MockCapture capture;
    MockMetadata metadata;
    ui.active_root = button_tree();
    ui.package = "com.example.app";

    ToolRegistry registry;
    ScreenTools tools(ui, capture, metadata, ScreenToolOptions{});
    tools.register_all(registry);

    SECTION("RegistersTools") {
        REQUIRE(registry.contains("get_screen_state"));
        REQUIRE(registry.contains("get_screen_info"));
        REQUIRE(registry.contains("list_windows"));
        auto defs = registry.list();
        auto& schema = defs[1]->input_schema;
        REQUIRE(defs[1]->name == "get_screen_state");
        REQUIRE(schema["properties"]["include_screenshot"]["type"] == "boolean");
    }

    SECTION("StateWithoutScreenshot") {
        auto r = registry.dispatch("get_screen_state", json::object());
        REQUIRE_FALSE(r.is_error);
        REQUIRE(r.content.size() == 1);
        auto text = text_of(r);
        REQUIRE(text.find(kDegradedLine) != std::string::npos);
        REQUIRE(text.find("pkg:com.example.app") != std::string::npos);
        REQUIRE(text.ends_with("btn1\tButton\tOK\t-\t-\t50,800,250,1000\ton,clk,ena"));
        REQUIRE(capture.last_max_width == 0);
    }

    SECTION("StateWithScreenshot") {
        auto r = registry.dispatch("get_screen_state", {{"include_screenshot", true}});
        REQUIRE_FALSE(r.is_error);
        REQUIRE(r.content.size() == 2);
        REQUIRE(std::holds_alternative<TextContent>(r.content[0]));
        auto& img = std::get<ImageContent>(r.content[1]);
        REQUIRE(img.mime_type == "image/jpeg");

        auto decoded = QByteArray::fromBase64Encoding(QByteArray::fromStdString(img.data),
                                                      QByteArray::AbortOnBase64DecodingErrors);
        REQUIRE(decoded);
        const QByteArray& bytes = *decoded;
        REQUIRE(bytes.size() > 4);
        REQUIRE(static_cast<unsigned char>(bytes[0]) == 0xFF);
        REQUIRE(static_cast<unsigned char>(bytes[1]) == 0xD8);
        REQUIRE(capture.last_max_width == 700);
        REQUIRE(capture.last_max_height == 700);
    }

    SECTION("MaxDimensionArgument") {
        auto r = registry.dispatch("get_screen_state", {{"include_screenshot", true}, {"max_dimension", 128}});
        REQUIRE_FALSE(r.is_error);
        REQUIRE(capture.last_max_width == 128);

        registry.dispatch("get_screen_state", {{"include_screenshot", true}, {"max_dimension", 5000}});
        REQUIRE(capture.last_max_width == 700);
    }

    SECTION("MaxDimensionTooSmall") {
        auto r = registry.dispatch("get_screen_state", {{"include_screenshot", true}, {"max_dimension", 10}});
        REQUIRE(r.is_error);
        REQUIRE(text_of(r) == "Parameter 'max_dimension' must be at least 64");
    }

    SECTION("BadArgumentCheckedBeforeReadiness") {
        ui.ready = false;
        auto r = registry.dispatch("get_screen_state", {{"include_screenshot", "yes"}});
        REQUIRE(r.is_error);
        REQUIRE(text_of(r) == "Parameter 'include_screenshot' must be a boolean");
    }

    SECTION("NotReady") {
        ui.ready = false;
        auto r = registry.dispatch("get_screen_state", json::object());
        REQUIRE(r.is_error);
        REQUIRE(text_of(r) ==
                "Accessibility service not enabled or not ready. "
                "Please enable it in Android Settings > Accessibility.");
    }

    SECTION("NoRoot") {
        ui.active_root.reset();
        auto r = registry.dispatch("get_screen_state", json::object());
        REQUIRE(r.is_error);
        REQUIRE(text_of(r) == "Failed to obtain root accessibility node.");
    }

    SECTION("CaptureUnavailable") {
        capture.available = false;
        auto r = registry.dispatch("get_screen_state", {{"include_screenshot", true}});
        REQUIRE(r.is_error);
        REQUIRE(r.content.size() == 1);
        REQUIRE(text_of(r) ==
                "Screen capture not available. Please enable the accessibility service in Android Settings.");
    }

    SECTION("CaptureFails") {
        capture.fail = true;
        auto r = registry.dispatch("get_screen_state", {{"include_screenshot", true}});
        REQUIRE(r.is_error);
        REQUIRE(text_of(r) == "Screenshot capture failed");
    }

    SECTION("AnnotationFails") {
        metadata.info.width = 0;
        auto r = registry.dispatch("get_screen_state", {{"include_screenshot", true}});
        REQUIRE(r.is_error);
        REQUIRE(text_of(r) == "Screenshot annotation failed");
    }

    SECTION("ScreenInfo") {
        metadata.info.orientation = Orientation::Landscape;
        auto r = registry.dispatch("get_screen_info", nullptr);
        REQUIRE_FALSE(r.is_error);
        auto j = json::parse(text_of(r));
        REQUIRE(j["width"] == 1080);
        REQUIRE(j["height"] == 2400);
        REQUIRE(j["densityDpi"] == 420);
        REQUIRE(j["orientation"] == "landscape");
    }

    SECTION("ListWindowsDegraded") {
        auto r = registry.dispatch("list_windows", json::object());
        REQUIRE_FALSE(r.is_error);
        REQUIRE(text_of(r) == std::string(kDegradedLine) + "\n" +
                "window:0 type:APPLICATION layer:0 focused:true pkg:com.example.app title:-");
    }

    SECTION("ListWindowsMulti") {
        ui.windows = {
            window(4, "APPLICATION", "com.example.app", 0, true),
            window(9, "INPUT_METHOD", "com.kbd", 1, false),
        };
        ui.roots[4] = button_tree();
        ui.roots[9] = make_node("kbd", "Keyboard", {0, 1800, 1080, 2400});

        auto r = registry.dispatch("list_windows", json::object());
        REQUIRE(text_of(r) ==
                "window:4 type:APPLICATION layer:0 focused:true pkg:com.example.app title:-\n"
                "window:9 type:INPUT_METHOD layer:1 focused:false pkg:com.kbd title:-");
    }
}
