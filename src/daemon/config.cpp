#include "config.hpp"

#include "platform/platform_paths.hpp"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>
#include <print>

namespace fs = std::filesystem;
using json = nlohmann::json;

Config Config::load(const std::string& path) {
    Config cfg;
    std::ifstream f(path);
    if (!f.is_open()) {
        std::println(stderr, "config: could not open {}, using defaults", path);
        return cfg;
    }

    try {
        auto j = json::parse(f);

        if (j.contains("server")) {
            auto& s = j["server"];
            if (s.contains("bind_address")) {
                auto addr = s["bind_address"].get<std::string>();
                if (addr == "127.0.0.1" || addr == "0.0.0.0") {
                    cfg.server.bind_address = addr;
                } else {
                    std::println(stderr, "config: unsupported bind_address {}, using 127.0.0.1", addr);
                }
            }
            if (s.contains("port")) {
                auto port = s["port"].get<int>();
                if (port >= 1 && port <= 65535) cfg.server.port = static_cast<uint16_t>(port);
                else std::println(stderr, "config: port {} out of range, using {}", port, cfg.server.port);
            }
            if (s.contains("bearer_token")) cfg.server.bearer_token = s["bearer_token"].get<std::string>();
            if (s.contains("workers")) cfg.server.workers = std::clamp(s["workers"].get<int>(), 1, 64);
        }

        if (j.contains("screenshot")) {
            auto& s = j["screenshot"];
            if (s.contains("max_dimension")) {
                cfg.screenshot.max_dimension = std::clamp(s["max_dimension"].get<int>(), 64, 4096);
            }
            if (s.contains("jpeg_quality")) {
                cfg.screenshot.jpeg_quality = std::clamp(s["jpeg_quality"].get<int>(), 1, 100);
            }
        }

        if (j.contains("device")) {
            auto& d = j["device"];
            if (d.contains("snapshot_path")) cfg.device.snapshot_path = d["snapshot_path"].get<std::string>();
            if (d.contains("screenshot_path")) cfg.device.screenshot_path = d["screenshot_path"].get<std::string>();
        }

        if (j.contains("call_log")) {
            auto& c = j["call_log"];
            if (c.contains("enabled")) cfg.call_log.enabled = c["enabled"].get<bool>();
            if (c.contains("path")) cfg.call_log.path = c["path"].get<std::string>();
        }

    } catch (const json::exception& e) {
        std::println(stderr, "config: parse error: {}", e.what());
    }

    return cfg;
}

Config Config::load_default() {
    auto dir = platform::config_dir();
    if (dir.empty()) return Config{};

    auto config_path = fs::path(dir) / "config.json";
    if (fs::exists(config_path)) {
        return load(config_path.string());
    }
    return Config{};
}
