#pragma once

#include "model/node.hpp"

#include <string>
#include <string_view>

inline constexpr std::string_view kNodeIdPrefix = "node_";
inline constexpr std::string_view kRootParentId = "root";

// Deterministic id from the node's identifying properties and tree position.
// Stable across parses as long as the UI does not change.
std::string generate_node_id(std::string_view resource_id, std::string_view class_name,
                             const Bounds& bounds, int depth, int index,
                             std::string_view parent_id);
