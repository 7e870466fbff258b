#pragma once

#include <chrono>
#include <cstddef>

namespace facetmcp::session {

// Fixed one-minute window counter. Owned by a single connection thread, so
// it carries no lock. A limit of 0 disables throttling.
class RateLimiter {
public:
    using Clock = std::chrono::steady_clock;

    explicit RateLimiter(std::size_t max_per_window,
                         Clock::duration window = std::chrono::minutes(1))
        : max_per_window_(max_per_window), window_(window) {}

    bool allow(Clock::time_point now = Clock::now()) {
        if (max_per_window_ == 0) {
            return true;
        }
        if (count_ == 0 || now - window_start_ >= window_) {
            window_start_ = now;
            count_ = 0;
        }
        if (count_ >= max_per_window_) {
            return false;
        }
        ++count_;
        return true;
    }

    std::size_t used() const { return count_; }

private:
    std::size_t max_per_window_;
    Clock::duration window_;
    Clock::time_point window_start_{};
    std::size_t count_ = 0;
};

}  // namespace facetmcp::session
