#include "execution/RateLimiter.h"
#include "common/Logger.h"
#include <regex>
#include <algorithm>

namespace autocoin {
namespace execution {

RateLimiter::RateLimiter(std::chrono::milliseconds window)
    : window_(window)
    , total_requests_(0)
    , rejected_requests_(0)
    , forced_waits_(0)
    , total_wait_time_(std::chrono::milliseconds(0))
    , is_blocked_(false)
{
    // 업비트 Exchange API (Key당)
    configs_.emplace("order", RateLimitConfig("order", 8));
    configs_.emplace("accounts", RateLimitConfig("accounts", 30));
    configs_.emplace("default", RateLimitConfig("default", 30));
}

void RateLimiter::setGroupLimit(const std::string& group, int max_per_window) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = configs_.find(group);
    if (it == configs_.end()) {
        configs_.emplace(group, RateLimitConfig(group, max_per_window));
    } else {
        it->second.max_per_window = max_per_window;
    }
    cv_.notify_all();
}

RateLimitConfig& RateLimiter::configFor(const std::string& group) {
    auto it = configs_.find(group);
    if (it == configs_.end()) it = configs_.find("default");
    return it->second;
}

bool RateLimiter::tryAcquire(const std::string& group) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (is_blocked_) {
        if (std::chrono::steady_clock::now() < block_end_time_) {
            rejected_requests_++;
            return false;
        }
        is_blocked_ = false;
        LOG_INFO("API 차단 자동 해제");
        cv_.notify_all();
    }

    auto& config = configFor(group);
    resetWindowIfNeeded(config);

    if (config.current_count < config.max_per_window) {
        config.current_count++;
        total_requests_++;
        return true;
    }

    rejected_requests_++;
    return false;
}

void RateLimiter::acquire(const std::string& group) {
    std::unique_lock<std::mutex> lock(mutex_);
    auto& config = configFor(group);

    while (true) {
        if (is_blocked_) {
            auto wait_start = std::chrono::steady_clock::now();
            if (wait_start < block_end_time_) {
                forced_waits_++;
                cv_.wait_until(lock, block_end_time_);
                total_wait_time_ += std::chrono::duration_cast<std::chrono::milliseconds>(
                    std::chrono::steady_clock::now() - wait_start
                );
                continue;  // 차단 기간이 연장됐을 수 있으므로 다시 확인
            }
            is_blocked_ = false;
        }

        resetWindowIfNeeded(config);

        if (config.current_count < config.max_per_window) {
            config.current_count++;
            total_requests_++;
            return;
        }

        // 다음 윈도우 시작까지 대기
        auto wake_time = config.window_start + window_ + std::chrono::milliseconds(1);

        forced_waits_++;
        auto wait_start = std::chrono::steady_clock::now();
        cv_.wait_until(lock, wake_time);
        total_wait_time_ += std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - wait_start
        );
    }
}

int RateLimiter::getRemainingRequests(const std::string& group) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& config = configFor(group);
    resetWindowIfNeeded(config);
    return std::max(0, config.max_per_window - config.current_count);
}

void RateLimiter::updateFromHeader(const std::string& remaining_req_header) {
    static const std::regex group_regex("group=([^;]+)");
    static const std::regex sec_regex("sec=(\\d+)");

    std::smatch match;
    std::string group_name = "default";
    int remaining = -1;

    if (std::regex_search(remaining_req_header, match, group_regex)) {
        group_name = match[1];
    }
    if (std::regex_search(remaining_req_header, match, sec_regex)) {
        try {
            remaining = std::stoi(match[1]);
        } catch (const std::exception&) {
            return;
        }
    }

    if (remaining < 0) {
        return;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    auto it = configs_.find(group_name);
    if (it != configs_.end()) {
        resetWindowIfNeeded(it->second);
        // 서버 기준 잔여량이 로컬보다 적으면 보정
        int used_remote = it->second.max_per_window - remaining;
        if (used_remote > it->second.current_count) {
            it->second.current_count = used_remote;
        }
    }
}

void RateLimiter::handleRateLimitError(int status_code) {
    std::lock_guard<std::mutex> lock(mutex_);

    std::chrono::steady_clock::duration block_for{};
    if (status_code == 429) {
        LOG_WARN("429 Too Many Requests - 1초간 전체 일시정지");
        block_for = std::chrono::seconds(1);
    } else if (status_code == 418) {
        LOG_ERROR("418 IP 차단 감지 - 1분간 전체 정지");
        block_for = std::chrono::minutes(1);
    } else {
        return;
    }

    auto until = std::chrono::steady_clock::now() + block_for;
    if (!is_blocked_ || until > block_end_time_) {
        block_end_time_ = until;
    }
    is_blocked_ = true;
    cv_.notify_all();
}

bool RateLimiter::isBlocked() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return is_blocked_ && std::chrono::steady_clock::now() < block_end_time_;
}

RateLimiter::Stats RateLimiter::getStats() const {
    std::lock_guard<std::mutex> lock(mutex_);

    Stats stats;
    stats.total_requests = total_requests_;
    stats.rejected_requests = rejected_requests_;
    stats.forced_waits = forced_waits_;
    stats.total_wait_time = total_wait_time_;
    return stats;
}

void RateLimiter::resetWindowIfNeeded(RateLimitConfig& config) {
    auto now = std::chrono::steady_clock::now();
    if (now - config.window_start >= window_) {
        config.current_count = 0;
        config.window_start = now;
        cv_.notify_all();
    }
}

} // namespace execution
} // namespace autocoin
