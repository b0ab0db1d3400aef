#include "common/RateLimitedLogger.h"

namespace autocoin {

RateLimitedLogger::RateLimitedLogger(std::chrono::milliseconds interval)
    : interval_(interval)
    , last_emit_(Clock::now()) {}

std::optional<std::uint64_t> RateLimitedLogger::record() {
    std::lock_guard<std::mutex> lock(mutex_);
    ++pending_;
    ++total_;

    auto now = Clock::now();
    if (now - last_emit_ < interval_) {
        return std::nullopt;
    }

    std::uint64_t count = pending_;
    pending_ = 0;
    last_emit_ = now;
    return count;
}

std::uint64_t RateLimitedLogger::total() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return total_;
}

} // namespace autocoin
