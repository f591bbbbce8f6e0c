#include "rate_limits.hpp"

#include <algorithm>

RateLimitModel::RateLimitModel(int used_percent, int window_duration_mins, int64_t resets_at,
                               std::string credit_balance)
    : used_percent_(std::clamp(used_percent, 0, 100)),
      window_duration_mins_(window_duration_mins),
      resets_at_(resets_at),
      credit_balance_(std::move(credit_balance)) {}

RateLimitSnapshot RateLimitModel::read() const {
    return {
        .used_percent = used_percent_,
        .window_duration_mins = window_duration_mins_,
        .resets_at = resets_at_,
    };
}

int RateLimitModel::bump(int delta) {
    if (delta > 0) {
        used_percent_ = std::min(100, used_percent_ + delta);
    }
    return used_percent_;
}

bool RateLimitModel::roll_window(int64_t now) {
    if (now < resets_at_ || window_duration_mins_ <= 0) return false;

    int64_t window_s = int64_t{window_duration_mins_} * 60;
    while (resets_at_ <= now) {
        resets_at_ += window_s;
    }
    used_percent_ = 0;
    return true;
}
