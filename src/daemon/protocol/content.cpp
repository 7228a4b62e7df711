#include "protocol/content.hpp"

using json = nlohmann::json;

ToolResult text_result(std::string text) {
    ToolResult r;
    r.content.emplace_back(TextContent{std::move(text)});
    return r;
}

ToolResult error_result(std::string message) {
    ToolResult r = text_result(std::move(message));
    r.is_error = true;
    return r;
}

ToolResult make_screen_result(std::string text, std::optional<EncodedImage> image) {
    ToolResult r = text_result(std::move(text));
    if (image) {
        r.content.emplace_back(ImageContent{
            .data = std::move(image->data_base64),
            .mime_type = std::move(image->mime_type),
        });
    }
    return r;
}

json to_json(const ToolResult& result) {
    json items = json::array();
    for (auto& item : result.content) {
        if (auto* t = std::get_if<TextContent>(&item)) {
            items.push_back({{"type", "text"}, {"text", t->text}});
        } else {
            auto& img = std::get<ImageContent>(item);
            items.push_back({{"type", "image"}, {"data", img.data}, {"mimeType", img.mime_type}});
        }
    }
    return {{"content", std::move(items)}, {"isError", result.is_error}};
}
