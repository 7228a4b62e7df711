#include "model/node_id.hpp"

#include <cstdint>
#include <format>

namespace {

uint32_t fnv1a(std::string_view s) {
    uint32_t h = 2166136261u;
    for (unsigned char c : s) {
        h ^= c;
        h *= 16777619u;
    }
    return h;
}

} // namespace

std::string generate_node_id(std::string_view resource_id, std::string_view class_name,
                             const Bounds& bounds, int depth, int index,
                             std::string_view parent_id) {
    auto input = std::format("{}|{}|{},{},{},{}|{}|{}|{}",
                             resource_id, class_name,
                             bounds.left, bounds.top, bounds.right, bounds.bottom,
                             depth, index, parent_id);
    return std::format("{}{:x}", kNodeIdPrefix, fnv1a(input));
}
