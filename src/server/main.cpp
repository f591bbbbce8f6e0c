#include "config.hpp"
#include "platform/linux/linux_event_loop.hpp"

#include <charconv>
#include <print>
#include <string>

static bool parse_port(const std::string& s, uint16_t& out) {
    auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), out);
    return ec == std::errc{} && ptr == s.data() + s.size();
}

int main(int argc, char* argv[]) {
    bool verbose = false;
    std::string config_path;
    std::string host;
    std::string port;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "--verbose" || arg == "-v") {
            verbose = true;
        } else if (arg == "--config" || arg == "-c") {
            if (i + 1 < argc) config_path = argv[++i];
        } else if (arg == "--host") {
            if (i + 1 < argc) host = argv[++i];
        } else if (arg == "--port" || arg == "-p") {
            if (i + 1 < argc) port = argv[++i];
        } else if (arg == "--help" || arg == "-h") {
            std::println("Usage: codex-mock-server [options]");
            std::println("Options:");
            std::println("  -v, --verbose       Log every request and turn step");
            std::println("  -c, --config PATH   Config file path");
            std::println("      --host ADDR     Listen address (default 127.0.0.1)");
            std::println("  -p, --port N        Listen port (default 8080)");
            std::println("  -h, --help          Show this help");
            return 0;
        }
    }

    // Load config
    Config config;
    if (!config_path.empty()) {
        config = Config::load(config_path);
    } else {
        config = Config::load_default();
    }

    if (!host.empty()) config.server.host = host;
    if (!port.empty() && !parse_port(port, config.server.port)) {
        std::println(stderr, "Invalid port: {}", port);
        return 1;
    }

    auto listen_host = config.server.host;
    LinuxEventLoop loop(std::move(config), verbose);
    if (!loop.init()) {
        std::println(stderr, "Failed to initialize event loop");
        return 1;
    }

    std::println("codex-mock-server listening on ws://{}:{} (Ctrl+C to stop)",
                 listen_host, loop.port());
    loop.run();
    return 0;
}
