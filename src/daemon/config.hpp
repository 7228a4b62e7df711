#pragma once

#include <cstdint>
#include <string>

struct Config {
    struct Server {
        std::string bind_address = "127.0.0.1"; // or "0.0.0.0"
        uint16_t port = 8080;
        std::string bearer_token;                // generated at startup when empty
        int workers = 4;
    } server;

    struct Screenshot {
        int max_dimension = 700;
        int jpeg_quality = 80;
    } screenshot;

    struct Device {
        std::string snapshot_path;   // JSON UI snapshot
        std::string screenshot_path; // P6 PPM screen image, empty = no capture
    } device;

    struct CallLog {
        bool enabled = true;
        std::string path; // empty = <data dir>/calls.db
    } call_log;

    static Config load(const std::string& path);
    static Config load_default();
};
