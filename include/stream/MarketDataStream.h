#pragma once

#include "common/Channel.h"
#include "common/RateLimitedLogger.h"
#include "common/Types.h"
#include "network/IStreamTransport.h"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace autocoin {
namespace stream {

struct StreamOptions {
    std::string url = "wss://api.upbit.com/websocket/v1";
    std::string subscription_type = "trade";
    int max_retries = 5;
    std::chrono::milliseconds retry_delay{5000};
};

// 재접속을 포함한 시세 스트림. 연결/구독 성공 시 재시도 카운터 리셋,
// 연속 실패가 max_retries를 넘으면 TradingError(MAX_RETRIES_EXCEEDED)
class MarketDataStream {
public:
    using Sleeper = std::function<void(std::chrono::milliseconds)>;

    MarketDataStream(std::unique_ptr<network::IStreamTransport> transport,
                     StreamOptions options,
                     std::shared_ptr<RateLimitedLogger> summary_log,
                     Sleeper sleeper = {});

    // stop() 또는 out이 닫히면 정상 반환. 치명적 오류는 예외
    void run(const std::vector<std::string>& markets, ISender<Tick>& out);

    void stop();

    int connectAttempts() const { return connect_attempts_.load(); }
    int retryCount() const { return retry_count_.load(); }
    long long ticksReceived() const { return ticks_received_.load(); }

private:
    // 한 번의 연결 수명. 정상 종료(stop/out 닫힘)면 true
    bool connectAndStream(const std::vector<std::string>& markets, ISender<Tick>& out);
    void handleFrame(const std::string& frame, ISender<Tick>& out, bool& out_closed);
    void sleepBeforeRetry();

    std::unique_ptr<network::IStreamTransport> transport_;
    StreamOptions options_;
    std::shared_ptr<RateLimitedLogger> summary_log_;
    Sleeper sleeper_;

    std::atomic<bool> stop_requested_{false};
    std::atomic<int> connect_attempts_{0};
    std::atomic<int> retry_count_{0};
    std::atomic<long long> ticks_received_{0};

    std::mutex wait_mutex_;
    std::condition_variable wait_cv_;
};

} // namespace stream
} // namespace autocoin
