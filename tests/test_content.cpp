#include <catch2/catch_test_macros.hpp>

#include "protocol/content.hpp"

using json = nlohmann::json;

TEST_CASE("Response assembly", "[content]") {

    SECTION("TextOnly") {
        auto r = make_screen_result("hello", std::nullopt);
        REQUIRE_FALSE(r.is_error);
        REQUIRE(r.content.size() == 1);
        REQUIRE(std::get<TextContent>(r.content[0]).text == "hello");
    }

    SECTION("TextThenImage") {
        auto r = make_screen_result("doc", EncodedImage{.data_base64 = "AAAA", .mime_type = "image/jpeg"});
        REQUIRE(r.content.size() == 2);
        REQUIRE(std::holds_alternative<TextContent>(r.content[0]));
        auto& img = std::get<ImageContent>(r.content[1]);
        REQUIRE(img.data == "AAAA");
        REQUIRE(img.mime_type == "image/jpeg");
    }

    SECTION("ErrorResult") {
        auto r = error_result("nope");
        REQUIRE(r.is_error);
        REQUIRE(std::get<TextContent>(r.content[0]).text == "nope");
    }

    SECTION("JsonShape") {
        auto j = to_json(make_screen_result("doc", EncodedImage{.data_base64 = "QUJD"}));
        REQUIRE(j["isError"] == false);
        REQUIRE(j["content"].size() == 2);
        REQUIRE(j["content"][0] == json{{"type", "text"}, {"text", "doc"}});
        REQUIRE(j["content"][1] == json{{"type", "image"}, {"data", "QUJD"}, {"mimeType", "image/jpeg"}});
    }

    SECTION("JsonErrorFlag") {
        auto j = to_json(error_result("bad"));
        REQUIRE(j["isError"] == true);
        REQUIRE(j["content"][0]["text"] == "bad");
    }
}
