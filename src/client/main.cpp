#include "http_client.hpp"

#include <QByteArray>

#include <charconv>
#include <cstdlib>
#include <expected>
#include <format>
#include <fstream>
#include <nlohmann/json.hpp>
#include <print>
#include <string>
#include <string_view>
#include <vector>

using json = nlohmann::json;

static void usage(const char* prog) {
    std::println(stderr, "Usage: {} [--url URL] [--token TOKEN] <command> [options]", prog);
    std::println(stderr, "Commands:");
    std::println(stderr, "  health                          Check the server is up (no token needed)");
    std::println(stderr, "  init                            Run the MCP initialize handshake");
    std::println(stderr, "  tools                           List available tools");
    std::println(stderr, "  call NAME [JSON]                Call a tool with JSON arguments");
    std::println(stderr, "  screen [--screenshot FILE]      Print the screen state, optionally saving the JPEG");
    std::println(stderr, "  logs [--limit N]                Show recent tool calls");
    std::println(stderr, "The token defaults to $RCMCP_TOKEN.");
}

// Prints text items, writes the first image to screenshot_path when given.
static int print_tool_result(const json& result, const std::string& screenshot_path) {
    bool wrote_image = false;
    for (auto& item : result.value("content", json::array())) {
        auto type = item.value("type", std::string{});
        if (type == "text") {
            std::println("{}", item.value("text", std::string{}));
        } else if (type == "image") {
            if (screenshot_path.empty() || wrote_image) {
                std::println("[image {} omitted]", item.value("mimeType", std::string{}));
                continue;
            }
            auto decoded = QByteArray::fromBase64Encoding(
                QByteArray::fromStdString(item.value("data", std::string{})),
                QByteArray::AbortOnBase64DecodingErrors);
            if (!decoded) {
                std::println(stderr, "Bad image data: not valid base64");
                return 1;
            }
            const QByteArray& bytes = *decoded;
            std::ofstream out(screenshot_path, std::ios::binary);
            out.write(bytes.constData(), static_cast<std::streamsize>(bytes.size()));
            if (!out) {
                std::println(stderr, "Failed to write {}", screenshot_path);
                return 1;
            }
            std::println(stderr, "Screenshot saved to {} ({} bytes)", screenshot_path, bytes.size());
            wrote_image = true;
        }
    }
    return result.value("isError", false) ? 1 : 0;
}

int main(int argc, char* argv[]) {
    std::string url = "http://127.0.0.1:8080";
    std::string token;
    if (const char* env = std::getenv("RCMCP_TOKEN")) token = env;

    int i = 1;
    for (; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "--url" && i + 1 < argc) {
            url = argv[++i];
        } else if (arg == "--token" && i + 1 < argc) {
            token = argv[++i];
        } else if (arg == "--help" || arg == "-h") {
            usage(argv[0]);
            return 0;
        } else {
            break;
        }
    }

    if (i >= argc) {
        usage(argv[0]);
        return 1;
    }

    std::string command = argv[i++];
    std::string screenshot_path;
    int limit = 20;
    std::vector<std::string> positional;

    for (; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "--screenshot" && i + 1 < argc) {
            screenshot_path = argv[++i];
        } else if (arg == "--limit" && i + 1 < argc) {
            std::string_view value = argv[++i];
            auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), limit);
            if (ec != std::errc{} || ptr != value.data() + value.size() || limit < 1) {
                std::println(stderr, "Invalid --limit: {}", value);
                return 1;
            }
        } else {
            positional.push_back(arg);
        }
    }

    HttpClient client(url, token);

    if (command == "health") {
        auto reply = client.get("/health");
        if (!reply) {
            std::println(stderr, "Failed to reach server at {}: {}", url, reply.error());
            return 1;
        }
        std::println("{}", reply->body);
        return reply->status == 200 ? 0 : 1;
    }

    if (command == "logs") {
        auto reply = client.get(std::format("/logs?limit={}", limit));
        if (!reply) {
            std::println(stderr, "{}", reply.error());
            return 1;
        }
        if (reply->status != 200) {
            std::println(stderr, "HTTP {}: {}", reply->status, reply->body);
            return 1;
        }
        try {
            auto j = json::parse(reply->body);
            for (auto& e : j.value("entries", json::array())) {
                std::println("[{}] {} {}ms{} {}", e.value("timestamp", std::string{}),
                             e.value("tool", std::string{}), e.value("duration_ms", 0),
                             e.value("is_error", false) ? " ERROR" : "",
                             e.value("params", std::string{}));
            }
        } catch (const json::exception& e) {
            std::println(stderr, "Bad response: {}", e.what());
            return 1;
        }
        return 0;
    }

    std::expected<json, std::string> result;
    if (command == "init") {
        result = client.rpc("initialize", {
            {"protocolVersion", "2024-11-05"},
            {"capabilities", json::object()},
            {"clientInfo", {{"name", "rcmcp"}, {"version", "1"}}},
        });
    } else if (command == "tools") {
        result = client.rpc("tools/list");
        if (result) {
            for (auto& tool : result->value("tools", json::array())) {
                std::println("{:<20} {}", tool.value("name", std::string{}),
                             tool.value("description", std::string{}));
            }
            return 0;
        }
    } else if (command == "call") {
        if (positional.empty()) {
            std::println(stderr, "call needs a tool name");
            return 1;
        }
        json arguments = json::object();
        if (positional.size() > 1) {
            try {
                arguments = json::parse(positional[1]);
            } catch (const json::exception& e) {
                std::println(stderr, "Invalid JSON arguments: {}", e.what());
                return 1;
            }
        }
        result = client.rpc("tools/call", {{"name", positional[0]}, {"arguments", arguments}});
        if (result) return print_tool_result(*result, screenshot_path);
    } else if (command == "screen") {
        json arguments = {{"include_screenshot", !screenshot_path.empty()}};
        result = client.rpc("tools/call", {{"name", "get_screen_state"}, {"arguments", arguments}});
        if (result) return print_tool_result(*result, screenshot_path);
    } else {
        std::println(stderr, "Unknown command: {}", command);
        usage(argv[0]);
        return 1;
    }

    if (!result) {
        std::println(stderr, "Error: {}", result.error());
        return 1;
    }
    std::println("{}", result->dump(2));
    return 0;
}
