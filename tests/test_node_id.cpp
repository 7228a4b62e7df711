#include <catch2/catch_test_macros.hpp>

#include "model/node_id.hpp"

TEST_CASE("Node ids", "[model]") {
    const Bounds b{0, 0, 100, 50};

    SECTION("PrefixedHex") {
        auto id = generate_node_id("com.example:id/ok", "android.widget.Button", b, 2, 0, "root");
        REQUIRE(id.starts_with("node_"));
        REQUIRE(id.size() > 5);
        REQUIRE(id.size() <= 13);
        for (char c : id.substr(5)) {
            REQUIRE(((c >= '0' && c <= '9') || (c >= 'a' && c <= 'f')));
        }
    }

    SECTION("Stable") {
        REQUIRE(generate_node_id("r", "c", b, 1, 3, "p") == generate_node_id("r", "c", b, 1, 3, "p"));
    }

    SECTION("PositionMatters") {
        auto base = generate_node_id("", "View", b, 1, 0, "root");
        REQUIRE(base != generate_node_id("", "View", b, 1, 1, "root"));
        REQUIRE(base != generate_node_id("", "View", b, 2, 0, "root"));
        REQUIRE(base != generate_node_id("", "View", b, 1, 0, "node_1"));
        REQUIRE(base != generate_node_id("", "View", Bounds{0, 0, 100, 51}, 1, 0, "root"));
    }

    SECTION("KnownValue") {
        // FNV-1a of "||0,0,0,0|0|0|root"
        REQUIRE(generate_node_id("", "", Bounds{}, 0, 0, kRootParentId) == "node_c579b2d5");
    }
}
