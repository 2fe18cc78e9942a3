#include <meshgate/core/rate_limiter.hpp>
#include <algorithm>

namespace meshgate {

FixedWindowLimiter::FixedWindowLimiter(int max_messages, int64_t window_ms)
    : max_messages_(max_messages)
    , window_ms_(window_ms)
    , count_(0)
    , window_start_ms_(0) {}

bool FixedWindowLimiter::window_expired(int64_t now_ms) const {
    return count_ == 0 || now_ms - window_start_ms_ >= window_ms_;
}

RateLimitResult FixedWindowLimiter::check(int64_t now_ms) const {
    if (window_expired(now_ms)) {
        return RateLimitResult::allow(max_messages_, max_messages_);
    }

    if (count_ >= max_messages_) {
        int64_t wait_ms = (window_start_ms_ + window_ms_) - now_ms;
        return RateLimitResult::deny(std::max(wait_ms, static_cast<int64_t>(1)), max_messages_);
    }

    return RateLimitResult::allow(max_messages_ - count_, max_messages_);
}

void FixedWindowLimiter::record(int64_t now_ms) {
    if (window_expired(now_ms)) {
        window_start_ms_ = now_ms;
        count_ = 1;
        return;
    }
    ++count_;
}

void FixedWindowLimiter::reset() {
    count_ = 0;
    window_start_ms_ = 0;
}

} // namespace meshgate
