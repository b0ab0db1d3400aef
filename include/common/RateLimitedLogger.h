#pragma once

#include <chrono>
#include <cstdint>
#include <mutex>
#include <optional>

namespace autocoin {

// 주기적 요약 로그용 카운터. 컴포넌트가 인스턴스를 소유한다.
class RateLimitedLogger {
public:
    explicit RateLimitedLogger(std::chrono::milliseconds interval);

    // 이벤트 1건 기록. interval이 지났으면 누적 건수를 돌려주고 카운터를 리셋
    std::optional<std::uint64_t> record();

    std::uint64_t total() const;

private:
    using Clock = std::chrono::steady_clock;

    std::chrono::milliseconds interval_;
    Clock::time_point last_emit_;
    std::uint64_t pending_ = 0;
    std::uint64_t total_ = 0;
    mutable std::mutex mutex_;
};

} // namespace autocoin
