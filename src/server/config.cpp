#include "config.hpp"

#include "platform/platform_paths.hpp"

#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>
#include <print>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

template <typename T>
void read_key(const json& section, const char* key, T& out) {
    if (section.contains(key)) out = section[key].get<T>();
}

} // namespace

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
            read_key(s, "host", cfg.server.host);
            read_key(s, "port", cfg.server.port);
        }

        if (j.contains("turn")) {
            auto& t = j["turn"];
            read_key(t, "start_delay_ms", cfg.turn.start_delay_ms);
            read_key(t, "stream_delay_ms", cfg.turn.stream_delay_ms);
            read_key(t, "delta_interval_ms", cfg.turn.delta_interval_ms);
            read_key(t, "approval_delay_ms", cfg.turn.approval_delay_ms);
            read_key(t, "tool_start_delay_ms", cfg.turn.tool_start_delay_ms);
            read_key(t, "tool_duration_ms", cfg.turn.tool_duration_ms);
            read_key(t, "usage_delay_ms", cfg.turn.usage_delay_ms);
            read_key(t, "response_text", cfg.turn.response_text);
            read_key(t, "command", cfg.turn.command);
            read_key(t, "command_output", cfg.turn.command_output);
            read_key(t, "interrupt_cancels", cfg.turn.interrupt_cancels);
        }

        if (j.contains("rate_limits")) {
            auto& r = j["rate_limits"];
            read_key(r, "used_percent", cfg.rate_limits.used_percent);
            read_key(r, "window_mins", cfg.rate_limits.window_mins);
            read_key(r, "resets_in_s", cfg.rate_limits.resets_in_s);
            read_key(r, "min_bump", cfg.rate_limits.min_bump);
            read_key(r, "max_bump", cfg.rate_limits.max_bump);
            read_key(r, "credit_balance", cfg.rate_limits.credit_balance);
            read_key(r, "plan_type", cfg.rate_limits.plan_type);
        }

        if (j.contains("thread_defaults")) {
            auto& d = j["thread_defaults"];
            read_key(d, "model", cfg.thread_defaults.model);
            read_key(d, "model_provider", cfg.thread_defaults.model_provider);
            read_key(d, "cwd", cfg.thread_defaults.cwd);
            read_key(d, "approval_policy", cfg.thread_defaults.approval_policy);
            read_key(d, "sandbox", cfg.thread_defaults.sandbox);
            read_key(d, "cli_version", cfg.thread_defaults.cli_version);
        }

        read_key(j, "seed_demo_data", cfg.seed_demo_data);

    } catch (const json::exception& e) {
        std::println(stderr, "config: parse error: {}", e.what());
    }

    if (cfg.rate_limits.used_percent > 100) cfg.rate_limits.used_percent = 100;
    if (cfg.rate_limits.min_bump > cfg.rate_limits.max_bump) {
        cfg.rate_limits.max_bump = cfg.rate_limits.min_bump;
    }

    return cfg;
}

Config Config::load_default() {
    auto dir = platform::config_dir();
    if (dir.empty()) return Config{};

    auto config_path = dir / "config.json";
    if (fs::exists(config_path)) {
        return load(config_path.string());
    }
    return Config{};
}
