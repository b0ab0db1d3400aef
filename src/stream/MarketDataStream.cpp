#include "stream/MarketDataStream.h"

#include "common/Error.h"
#include "common/Logger.h"
#include "network/JwtGenerator.h"
#include "stream/TickDecoder.h"

namespace autocoin {
namespace stream {

MarketDataStream::MarketDataStream(std::unique_ptr<network::IStreamTransport> transport,
                                   StreamOptions options,
                                   std::shared_ptr<RateLimitedLogger> summary_log,
                                   Sleeper sleeper)
    : transport_(std::move(transport))
    , options_(std::move(options))
    , summary_log_(std::move(summary_log))
    , sleeper_(std::move(sleeper))
{
    if (!summary_log_) {
        summary_log_ = std::make_shared<RateLimitedLogger>(std::chrono::seconds(60));
    }
}

void MarketDataStream::run(const std::vector<std::string>& markets, ISender<Tick>& out) {
    retry_count_ = 0;

    while (!stop_requested_.load()) {
        try {
            if (connectAndStream(markets, out)) {
                break;
            }
        } catch (const TradingError& e) {
            transport_->close();
            if (stop_requested_.load()) {
                break;
            }
            if (!e.isRetryable()) {
                LOG_ERROR("[Stream] 복구 불가 오류: {} ({})", e.what(), toString(e.code()));
                throw;
            }
            if (retry_count_.load() >= options_.max_retries) {
                LOG_ERROR("[Stream] 최대 재시도 횟수 초과 ({}회): {}", options_.max_retries, e.what());
                throw TradingError(ErrorCode::MAX_RETRIES_EXCEEDED, "max retries exceeded");
            }
            ++retry_count_;
            LOG_WARN("[Stream] 연결 끊김: {} - {}ms 후 재연결 ({}/{})",
                     e.what(), options_.retry_delay.count(), retry_count_.load(), options_.max_retries);
            sleepBeforeRetry();
        }
    }

    transport_->close();
    LOG_INFO("[Stream] 종료 (수신 tick {}건)", ticks_received_.load());
}

bool MarketDataStream::connectAndStream(const std::vector<std::string>& markets, ISender<Tick>& out) {
    ++connect_attempts_;
    transport_->connect(options_.url);

    const std::string subscription = TickDecoder::buildSubscription(
        network::JwtGenerator::generateUUID(), options_.subscription_type, markets);
    transport_->send(subscription);

    retry_count_ = 0;
    LOG_INFO("[Stream] 구독 시작: {} ({}개 마켓)", options_.subscription_type, markets.size());

    while (!stop_requested_.load()) {
        std::string frame;
        try {
            frame = transport_->read();
        } catch (const TradingError&) {
            if (stop_requested_.load()) {
                return true;
            }
            throw;
        }

        bool out_closed = false;
        handleFrame(frame, out, out_closed);
        if (out_closed) {
            LOG_INFO("[Stream] 출력 채널 닫힘 - 스트림 종료");
            return true;
        }
    }
    return true;
}

void MarketDataStream::handleFrame(const std::string& frame, ISender<Tick>& out, bool& out_closed) {
    std::optional<Tick> tick;
    try {
        tick = TickDecoder::decode(frame);
    } catch (const TradingError& e) {
        LOG_WARN("[Stream] 잘못된 프레임 무시: {}", e.what());
        return;
    }
    if (!tick) {
        return;
    }

    ++ticks_received_;
    if (auto count = summary_log_->record()) {
        LOG_INFO("[Stream] 최근 구간 tick {}건 수신 (누적 {}), 마지막 {} @ {:.2f}",
                 *count, summary_log_->total(), tick->market, tick->trade_price);
    }

    if (!out.send(std::move(*tick))) {
        out_closed = true;
    }
}

void MarketDataStream::sleepBeforeRetry() {
    if (sleeper_) {
        sleeper_(options_.retry_delay);
        return;
    }
    std::unique_lock<std::mutex> lock(wait_mutex_);
    wait_cv_.wait_for(lock, options_.retry_delay, [this] { return stop_requested_.load(); });
}

void MarketDataStream::stop() {
    stop_requested_ = true;
    {
        std::lock_guard<std::mutex> lock(wait_mutex_);
    }
    wait_cv_.notify_all();
    transport_->interrupt();
}

} // namespace stream
} // namespace autocoin
