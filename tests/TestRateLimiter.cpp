#include "execution/RateLimiter.h"

#include <cassert>
#include <chrono>
#include <iostream>

using autocoin::execution::RateLimiter;

int main() {
    // 윈도우당 한도
    {
        RateLimiter limiter(std::chrono::milliseconds(200));
        limiter.setGroupLimit("order", 3);
        assert(limiter.tryAcquire("order"));
        assert(limiter.tryAcquire("order"));
        assert(limiter.tryAcquire("order"));
        assert(!limiter.tryAcquire("order"));
        assert(limiter.getRemainingRequests("order") == 0);

        // 다른 그룹은 독립
        assert(limiter.tryAcquire("accounts"));

        auto stats = limiter.getStats();
        assert(stats.total_requests == 4);
        assert(stats.rejected_requests == 1);
    }

    // acquire는 다음 윈도우까지 대기
    {
        RateLimiter limiter(std::chrono::milliseconds(100));
        limiter.setGroupLimit("order", 1);
        limiter.acquire("order");
        auto start = std::chrono::steady_clock::now();
        limiter.acquire("order");
        auto waited = std::chrono::steady_clock::now() - start;
        assert(waited >= std::chrono::milliseconds(50));
        assert(limiter.getStats().forced_waits >= 1);
    }

    // Remaining-Req 헤더가 로컬 카운트보다 적게 남았다고 하면 보정
    {
        RateLimiter limiter(std::chrono::milliseconds(1000));
        limiter.setGroupLimit("order", 8);
        limiter.updateFromHeader("group=order; min=100; sec=2");
        assert(limiter.getRemainingRequests("order") == 2);
    }

    // 429 -> 일시 차단
    {
        RateLimiter limiter(std::chrono::milliseconds(1000));
        limiter.handleRateLimitError(429);
        assert(limiter.isBlocked());
        assert(!limiter.tryAcquire("order"));
        limiter.handleRateLimitError(500);   // 무시
    }

    // 알 수 없는 그룹은 default 사용
    {
        RateLimiter limiter;
        assert(limiter.getRemainingRequests("unknown") == 30);
    }

    std::cout << "[TEST] RateLimiter PASSED\n";
    return 0;
}
