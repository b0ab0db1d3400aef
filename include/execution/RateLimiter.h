#pragma once

#include <string>
#include <map>
#include <chrono>
#include <mutex>
#include <condition_variable>

namespace autocoin {
namespace execution {

// Rate Limit 그룹별 설정
struct RateLimitConfig {
    std::string group_name;
    int max_per_window;           // 윈도우당 최대 요청 수
    int current_count;            // 현재 윈도우의 요청 수
    std::chrono::steady_clock::time_point window_start;

    RateLimitConfig(const std::string& name, int max_req)
        : group_name(name)
        , max_per_window(max_req)
        , current_count(0)
        , window_start(std::chrono::steady_clock::now())
    {}
};

// 고정 윈도우 Rate Limiter (Thread-Safe). 모든 거래소 호출이 공유한다.
class RateLimiter {
public:
    // 업비트 Exchange API 기본 그룹: order 8/s, accounts 30/s, default 30/s
    explicit RateLimiter(std::chrono::milliseconds window = std::chrono::milliseconds(1000));

    // 그룹 한도 설정/변경
    void setGroupLimit(const std::string& group, int max_per_window);

    // 즉시 가능하면 true (Non-blocking)
    bool tryAcquire(const std::string& group);

    // 윈도우가 리셋될 때까지 대기 후 획득 (Blocking)
    void acquire(const std::string& group);

    int getRemainingRequests(const std::string& group);

    // Remaining-Req 헤더 반영. 예: "group=order; min=57; sec=7"
    void updateFromHeader(const std::string& remaining_req_header);

    // 429: 1초, 418: 1분 동안 전체 acquire 차단
    void handleRateLimitError(int status_code);

    bool isBlocked() const;

    struct Stats {
        int total_requests;
        int rejected_requests;
        int forced_waits;
        std::chrono::milliseconds total_wait_time;
    };
    Stats getStats() const;

private:
    RateLimitConfig& configFor(const std::string& group);
    void resetWindowIfNeeded(RateLimitConfig& config);

    const std::chrono::milliseconds window_;
    std::map<std::string, RateLimitConfig> configs_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;

    int total_requests_;
    int rejected_requests_;
    int forced_waits_;
    std::chrono::milliseconds total_wait_time_;

    bool is_blocked_;
    std::chrono::steady_clock::time_point block_end_time_;
};

} // namespace execution
} // namespace autocoin
