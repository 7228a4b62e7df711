#include <catch2/catch_test_macros.hpp>

#include "config.hpp"
#include "platform/platform_paths.hpp"

#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <string>
#include <unistd.h>
#include <vector>

namespace {

// RAII temp file that auto-deletes.
struct TmpFile {
    std::string path;

    explicit TmpFile(const std::string& content) {
        path = std::filesystem::temp_directory_path() / "rcmcp_test_config_XXXXXX";
        std::vector<char> tmpl(path.begin(), path.end());
        tmpl.push_back('\0');
        int fd = mkstemp(tmpl.data());
        path.assign(tmpl.data());
        REQUIRE(fd >= 0);
        REQUIRE(::write(fd, content.data(), content.size()) == static_cast<ssize_t>(content.size()));
        ::close(fd);
    }

    ~TmpFile() { std::filesystem::remove(path); }
};

} // namespace

TEST_CASE("Config", "[config]") {

    SECTION("DefaultValues") {
        Config cfg;
        REQUIRE(cfg.server.bind_address == "127.0.0.1");
        REQUIRE(cfg.server.port == 8080);
        REQUIRE(cfg.server.bearer_token.empty());
        REQUIRE(cfg.server.workers == 4);
        REQUIRE(cfg.screenshot.max_dimension == 700);
        REQUIRE(cfg.screenshot.jpeg_quality == 80);
        REQUIRE(cfg.device.snapshot_path.empty());
        REQUIRE(cfg.device.screenshot_path.empty());
        REQUIRE(cfg.call_log.enabled);
        REQUIRE(cfg.call_log.path.empty());
    }

    SECTION("LoadFullConfig") {
        TmpFile f(R"({
            "server": {
                "bind_address": "0.0.0.0",
                "port": 9090,
                "bearer_token": "abc123",
                "workers": 8
            },
            "screenshot": { "max_dimension": 1024, "jpeg_quality": 60 },
            "device": { "snapshot_path": "/tmp/ui.json", "screenshot_path": "/tmp/screen.ppm" },
            "call_log": { "enabled": false, "path": "/tmp/calls.db" }
        })");

        auto cfg = Config::load(f.path);
        REQUIRE(cfg.server.bind_address == "0.0.0.0");
        REQUIRE(cfg.server.port == 9090);
        REQUIRE(cfg.server.bearer_token == "abc123");
        REQUIRE(cfg.server.workers == 8);
        REQUIRE(cfg.screenshot.max_dimension == 1024);
        REQUIRE(cfg.screenshot.jpeg_quality == 60);
        REQUIRE(cfg.device.snapshot_path == "/tmp/ui.json");
        REQUIRE(cfg.device.screenshot_path == "/tmp/screen.ppm");
        REQUIRE_FALSE(cfg.call_log.enabled);
        REQUIRE(cfg.call_log.path == "/tmp/calls.db");
    }

    SECTION("LoadPartialConfig") {
        TmpFile f(R"({ "server": { "port": 7000 } })");

        auto cfg = Config::load(f.path);
        REQUIRE(cfg.server.port == 7000);
        // Other fields retain defaults
        REQUIRE(cfg.server.bind_address == "127.0.0.1");
        REQUIRE(cfg.screenshot.max_dimension == 700);
        REQUIRE(cfg.call_log.enabled);
    }

    SECTION("OutOfRangeValues") {
        TmpFile f(R"({
            "server": { "bind_address": "192.168.1.5", "port": 70000, "workers": 0 },
            "screenshot": { "max_dimension": 10, "jpeg_quality": 500 }
        })");

        auto cfg = Config::load(f.path);
        REQUIRE(cfg.server.bind_address == "127.0.0.1");
        REQUIRE(cfg.server.port == 8080);
        REQUIRE(cfg.server.workers == 1);
        REQUIRE(cfg.screenshot.max_dimension == 64);
        REQUIRE(cfg.screenshot.jpeg_quality == 100);
    }

    SECTION("LoadInvalidJson") {
        TmpFile f("not json {{{");

        auto cfg = Config::load(f.path);
        // Falls back to defaults
        REQUIRE(cfg.server.port == 8080);
        REQUIRE(cfg.screenshot.jpeg_quality == 80);
    }

    SECTION("WrongTypeFallsBack") {
        TmpFile f(R"({ "server": { "port": "eighty" } })");
        auto cfg = Config::load(f.path);
        REQUIRE(cfg.server.port == 8080);
    }

    SECTION("LoadMissingFile") {
        auto cfg = Config::load("/tmp/rcmcp_test_nonexistent_config_file.json");
        REQUIRE(cfg.server.port == 8080);
        REQUIRE(cfg.server.bind_address == "127.0.0.1");
    }
}

TEST_CASE("Platform paths", "[config]") {
    std::string saved_config = std::getenv("XDG_CONFIG_HOME") ? std::getenv("XDG_CONFIG_HOME") : "";
    std::string saved_data = std::getenv("XDG_DATA_HOME") ? std::getenv("XDG_DATA_HOME") : "";
    bool had_config = std::getenv("XDG_CONFIG_HOME") != nullptr;
    bool had_data = std::getenv("XDG_DATA_HOME") != nullptr;

    SECTION("XdgOverrides") {
        setenv("XDG_CONFIG_HOME", "/tmp/xdg-config", 1);
        setenv("XDG_DATA_HOME", "/tmp/xdg-data", 1);
        REQUIRE(platform::config_dir() == "/tmp/xdg-config/rcmcp");
        REQUIRE(platform::data_dir() == "/tmp/xdg-data/rcmcp");
    }

    SECTION("HomeFallback") {
        unsetenv("XDG_CONFIG_HOME");
        unsetenv("XDG_DATA_HOME");
        const char* home = std::getenv("HOME");
        if (home) {
            REQUIRE(platform::config_dir() == std::string(home) + "/.config/rcmcp");
            REQUIRE(platform::data_dir() == std::string(home) + "/.local/share/rcmcp");
        } else {
            REQUIRE(platform::config_dir().empty());
        }
    }

    if (had_config) setenv("XDG_CONFIG_HOME", saved_config.c_str(), 1);
    else unsetenv("XDG_CONFIG_HOME");
    if (had_data) setenv("XDG_DATA_HOME", saved_data.c_str(), 1);
    else unsetenv("XDG_DATA_HOME");
}
