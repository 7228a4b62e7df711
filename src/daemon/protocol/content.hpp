#pragma once

#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <variant>
#include <vector>

struct TextContent {
    std::string text;
};

struct ImageContent {
    std::string data; // base64
    std::string mime_type;
};

using ContentItem = std::variant<TextContent, ImageContent>;

// Uniform result of a tool call.
struct ToolResult {
    std::vector<ContentItem> content;
    bool is_error = false;
};

struct EncodedImage {
    std::string data_base64;
    std::string mime_type = "image/jpeg";
};

ToolResult text_result(std::string text);
ToolResult error_result(std::string message);

// Text first, then the image when there is one. Clients rely on this order.
ToolResult make_screen_result(std::string text, std::optional<EncodedImage> image);

nlohmann::json to_json(const ToolResult& result);
