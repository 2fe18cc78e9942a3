#ifndef MESHGATE_CORE_RATE_LIMITER_HPP
#define MESHGATE_CORE_RATE_LIMITER_HPP

#include <cstdint>

namespace meshgate {

// Rate limit result
struct RateLimitResult {
    bool allowed;
    int64_t retry_after_ms;    // Milliseconds until next allowed request
    int remaining;             // Remaining requests in window
    int limit;                 // Total limit per window

    RateLimitResult()
        : allowed(true)
        , retry_after_ms(0)
        , remaining(0)
        , limit(0) {}

    static RateLimitResult allow(int remaining, int limit) {
        RateLimitResult r;
        r.allowed = true;
        r.remaining = remaining;
        r.limit = limit;
        return r;
    }

    static RateLimitResult deny(int64_t retry_after, int limit) {
        RateLimitResult r;
        r.allowed = false;
        r.retry_after_ms = retry_after;
        r.limit = limit;
        r.remaining = 0;
        return r;
    }
};

// Fixed window counter. The window opens with the first recorded message
// and closes `window_ms` later; the next message after that opens a new one.
// Times are passed in so callers can drive the limiter from their own clock.
class FixedWindowLimiter {
public:
    FixedWindowLimiter(int max_messages, int64_t window_ms);

    // Would a message at `now_ms` be rejected? Does not count it.
    RateLimitResult check(int64_t now_ms) const;

    // Count a message at `now_ms`
    void record(int64_t now_ms);

    int count() const { return count_; }
    int64_t window_start() const { return window_start_ms_; }

    void reset();

private:
    bool window_expired(int64_t now_ms) const;

    int max_messages_;
    int64_t window_ms_;
    int count_;
    int64_t window_start_ms_;
};

} // namespace meshgate

#endif // MESHGATE_CORE_RATE_LIMITER_HPP
