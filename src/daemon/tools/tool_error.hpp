#pragma once

#include <stdexcept>
#include <string>

enum class ToolErrorKind {
    Unauthorized,
    MethodNotFound,
    InvalidParams,
    PermissionDenied,
    ActionFailed,
    Timeout,
};

// Declared tool failure. Only message() reaches the client; kind() is for
// logging and tests.
class ToolError : public std::runtime_error {
public:
    ToolError(ToolErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    ToolErrorKind kind() const { return kind_; }
    std::string message() const { return what(); }

private:
    ToolErrorKind kind_;
};

const char* tool_error_kind_name(ToolErrorKind kind);
