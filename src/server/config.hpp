#pragma once

#include <cstdint>
#include <string>

struct Config {
    struct Server {
        std::string host = "127.0.0.1";
        uint16_t port = 8080;
    } server;

    // Pacing between turn steps, in milliseconds.
    struct Turn {
        uint32_t start_delay_ms = 300;
        uint32_t stream_delay_ms = 500;
        uint32_t delta_interval_ms = 80;
        uint32_t approval_delay_ms = 300;
        uint32_t tool_start_delay_ms = 1000;
        uint32_t tool_duration_ms = 500;
        uint32_t usage_delay_ms = 300;

        std::string response_text =
            "I'll help you with that. Let me analyze the code and make the necessary changes.";
        std::string command = "grep -r 'TODO' src/";
        std::string command_output =
            "src/main.ts:15: // TODO: refactor this\nsrc/utils.ts:8: // TODO: add validation";

        bool interrupt_cancels = false;
    } turn;

    struct RateLimits {
        uint32_t used_percent = 35;
        uint32_t window_mins = 300;
        uint32_t resets_in_s = 10800;
        uint32_t min_bump = 2;
        uint32_t max_bump = 7;
        std::string credit_balance = "$42.50";
        std::string plan_type = "pro";
    } rate_limits;

    // Run configuration reported for threads created by thread/start.
    struct ThreadDefaults {
        std::string model = "o4-mini";
        std::string model_provider = "openai";
        std::string cwd = "/Users/dev/workspace";
        std::string approval_policy = "auto-edit";
        std::string sandbox = "dangerFullAccess";
        std::string cli_version = "0.1.0";
    } thread_defaults;

    bool seed_demo_data = true;

    static Config load(const std::string& path);
    static Config load_default();
};
