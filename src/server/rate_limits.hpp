#pragma once

#include <cstdint>
#include <string>

struct RateLimitSnapshot {
    int used_percent = 0;
    int window_duration_mins = 0;
    int64_t resets_at = 0;
};

// Process-wide simulated quota. Written by the turn sequencer, read by the router.
class RateLimitModel {
public:
    RateLimitModel(int used_percent, int window_duration_mins, int64_t resets_at,
                   std::string credit_balance);

    RateLimitSnapshot read() const;

    // Increase usage by a positive delta, clamped to 100. Returns the new percentage.
    int bump(int delta);

    // Start a new window if the current one has elapsed. Returns true on reset.
    bool roll_window(int64_t now);

    const std::string& credit_balance() const { return credit_balance_; }

private:
    int used_percent_;
    int window_duration_mins_;
    int64_t resets_at_;
    std::string credit_balance_;
};
