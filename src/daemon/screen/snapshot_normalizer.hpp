#pragma once

#include "model/window.hpp"
#include "platform/ui_introspection.hpp"
#include "tools/tool_error.hpp"

#include <expected>

// Builds a fresh Snapshot from whatever the introspection source offers.
// Multi-window when at least two windows resolve, otherwise a single
// synthetic window 0 marked degraded.
class SnapshotNormalizer {
public:
    explicit SnapshotNormalizer(bool verbose = false) : verbose_(verbose) {}

    std::expected<Snapshot, ToolError> normalize(const UiIntrospection& source) const;

private:
    std::expected<Snapshot, ToolError> degraded(const UiIntrospection& source,
                                                const RawWindow* only) const;
    void log(const std::string& msg) const;

    bool verbose_;
};
