#include "auth/bearer_auth.hpp"
#include "config.hpp"
#include "platform/daemonizer.hpp"
#include "platform/linux/linux_event_loop.hpp"
#include "version.hpp"

#include <QGuiApplication>

#include <charconv>
#include <cstdlib>
#include <print>
#include <string>

static void print_usage() {
    std::println("Usage: rcmcpd [options]");
    std::println("Options:");
    std::println("  -c, --config PATH   Config file path");
    std::println("  -p, --port PORT     Listen port (overrides config)");
    std::println("  -b, --bind ADDR     127.0.0.1 or 0.0.0.0 (overrides config)");
    std::println("  -t, --token TOKEN   Bearer token (overrides config and RCMCP_TOKEN)");
    std::println("  -f, --foreground    Run in foreground (don't daemonize)");
    std::println("  -v, --verbose       Enable verbose logging");
    std::println("  -h, --help          Show this help");
}

int main(int argc, char* argv[]) {
    bool foreground = false;
    bool verbose = false;
    std::string config_path;
    std::string port_arg;
    std::string bind_arg;
    std::string token_arg;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        auto take_value = [&](std::string& out) {
            if (i + 1 >= argc) {
                std::println(stderr, "Missing value for {}", arg);
                return false;
            }
            out = argv[++i];
            return true;
        };

        if (arg == "--foreground" || arg == "-f") {
            foreground = true;
        } else if (arg == "--verbose" || arg == "-v") {
            verbose = true;
        } else if (arg == "--config" || arg == "-c") {
            if (!take_value(config_path)) return 1;
        } else if (arg == "--port" || arg == "-p") {
            if (!take_value(port_arg)) return 1;
        } else if (arg == "--bind" || arg == "-b") {
            if (!take_value(bind_arg)) return 1;
        } else if (arg == "--token" || arg == "-t") {
            if (!take_value(token_arg)) return 1;
        } else if (arg == "--help" || arg == "-h") {
            print_usage();
            return 0;
        } else {
            std::println(stderr, "Unknown option: {}", arg);
            print_usage();
            return 1;
        }
    }

    Config config = config_path.empty() ? Config::load_default() : Config::load(config_path);

    if (!port_arg.empty()) {
        int port = 0;
        auto [ptr, ec] = std::from_chars(port_arg.data(), port_arg.data() + port_arg.size(), port);
        if (ec != std::errc{} || ptr != port_arg.data() + port_arg.size() || port < 1 || port > 65535) {
            std::println(stderr, "Invalid port: {}", port_arg);
            return 1;
        }
        config.server.port = static_cast<uint16_t>(port);
    }

    if (!bind_arg.empty()) {
        if (bind_arg != "127.0.0.1" && bind_arg != "0.0.0.0") {
            std::println(stderr, "Invalid bind address: {} (expected 127.0.0.1 or 0.0.0.0)", bind_arg);
            return 1;
        }
        config.server.bind_address = bind_arg;
    }

    if (const char* env = std::getenv("RCMCP_TOKEN"); env && *env) {
        config.server.bearer_token = env;
    }
    if (!token_arg.empty()) {
        config.server.bearer_token = token_arg;
    }
    if (config.server.bearer_token.empty()) {
        config.server.bearer_token = generate_token();
        // Printed before daemonizing, stderr goes away afterwards.
        std::println(stderr, "Generated bearer token: {}", config.server.bearer_token);
    }

    if (!foreground && !platform::daemonize()) {
        return 1;
    }

    if (verbose && foreground) {
        std::println(stderr, "[rcmcp] Starting rcmcpd {} on {}:{}",
                     kServerVersion, config.server.bind_address, config.server.port);
    }

    // Screenshot labels need the font database; no display is used. The
    // application is created after the fork and its event loop never runs.
    if (qEnvironmentVariableIsEmpty("QT_QPA_PLATFORM")) {
        qputenv("QT_QPA_PLATFORM", "offscreen");
    }
    QGuiApplication app(argc, argv);
    QGuiApplication::setApplicationName("rcmcpd");
    QGuiApplication::setApplicationVersion(kServerVersion);

    LinuxEventLoop loop(std::move(config), verbose);
    if (!loop.init()) {
        std::println(stderr, "Failed to initialize event loop");
        return 1;
    }

    loop.run();
    return 0;
}
