#include "core/orchestration/TradingPipeline.h"

#include "common/Error.h"
#include "common/Logger.h"

namespace autocoin {
namespace core {

namespace {
void joinIfRunning(std::thread& t) {
    if (t.joinable()) {
        t.join();
    }
}
}

TradingPipeline::TradingPipeline(PipelineOptions options, PipelineComponents components)
    : options_(std::move(options))
    , components_(std::move(components))
    , ticks_(options_.channel_capacity)
    , signals_(options_.channel_capacity)
    , decisions_(options_.channel_capacity)
    , results_(options_.channel_capacity)
    , notifications_(options_.notification_capacity)
    , notification_agent_(components_.notifier)
{
    signal_ticks_ = ticks_.subscribe();
    risk_ticks_ = ticks_.subscribe();
}

TradingPipeline::~TradingPipeline() {
    stop();
}

void TradingPipeline::setResultObserver(ResultObserver observer) {
    observer_ = std::move(observer);
}

void TradingPipeline::start() {
    if (running_.exchange(true)) {
        return;
    }

    LOG_INFO("[Pipeline] 시작: 마켓 {}개, 채널 용량 {}", options_.markets.size(), options_.channel_capacity);
    refreshBalance();

    notification_thread_ = std::thread([this] { notification_agent_.run(notifications_); });
    result_thread_ = std::thread(&TradingPipeline::runResultConsumer, this);
    execution_thread_ = std::thread([this] { components_.execution_agent->run(decisions_, results_); });
    risk_thread_ = std::thread([this] { components_.risk_manager->run(*risk_ticks_, decisions_); });
    decision_thread_ = std::thread([this] { components_.decision_maker->run(signals_, decisions_); });
    detector_thread_ = std::thread([this] { components_.signal_detector->run(*signal_ticks_, signals_); });
    stream_thread_ = std::thread(&TradingPipeline::runStream, this);
}

void TradingPipeline::runStream() {
    try {
        components_.stream->run(options_.markets, ticks_);
    } catch (const TradingError& e) {
        stream_failed_ = true;
        LOG_ERROR("[Pipeline] 시세 스트림 치명 오류: {} ({})", e.what(), toString(e.code()));
        alert("Market data stream", e.what());
    } catch (const std::exception& e) {
        stream_failed_ = true;
        LOG_ERROR("[Pipeline] 시세 스트림 예외: {}", e.what());
        alert("Market data stream", e.what());
    }

    {
        std::lock_guard<std::mutex> lock(stream_mutex_);
        stream_done_ = true;
    }
    stream_cv_.notify_all();
}

// 알림 실패가 스트림 종료 처리나 잔고 갱신을 중단시키지 않도록 여기서 흡수
void TradingPipeline::alert(const std::string& title, const std::string& message) {
    if (!components_.notifier) {
        return;
    }
    try {
        components_.notifier->notifyAlert(title, message);
    } catch (const std::exception& e) {
        LOG_ERROR("[Pipeline] 경보 알림 실패 ({}): {}", title, e.what());
    }
}

bool TradingPipeline::waitForStreamEnd(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(stream_mutex_);
    return stream_cv_.wait_for(lock, timeout, [this] { return stream_done_; });
}

void TradingPipeline::runResultConsumer() {
    while (auto result = results_.receive()) {
        if (result->success) {
            LOG_INFO("[Pipeline] 주문 완료: {} {} ({})",
                     result->order.market, toString(result->order.side), result->order.id);
            refreshBalance();
        } else {
            LOG_WARN("[Pipeline] 주문 실패: {} - {}",
                     result->order.market, result->error.value_or("unknown"));
        }

        if (observer_) {
            observer_(*result);
        }

        if (!notifications_.trySend(*result)) {
            LOG_WARN("[Pipeline] 알림 채널 포화 - 알림 1건 폐기 ({})", result->order.id);
        }
    }
}

void TradingPipeline::refreshBalance() {
    if (!components_.exchange) {
        return;
    }
    try {
        const Amount balance = components_.exchange->getBalance();
        components_.decision_maker->setBalance(balance);
        LOG_INFO("[Pipeline] KRW 잔고 갱신: {:.0f}", balance);
    } catch (const TradingError& e) {
        LOG_WARN("[Pipeline] 잔고 조회 실패: {}", e.what());
        if (e.isAlertWorthy()) {
            alert("Exchange balance", e.what());
        }
    }
}

void TradingPipeline::stop() {
    if (!running_.exchange(false)) {
        return;
    }

    LOG_INFO("[Pipeline] 종료 요청 - 단계별 정리 시작");

    components_.stream->stop();
    joinIfRunning(stream_thread_);

    ticks_.close();
    joinIfRunning(detector_thread_);
    signals_.close();

    joinIfRunning(decision_thread_);
    joinIfRunning(risk_thread_);
    decisions_.close();

    // 남은 결정과 진행 중인 재시도까지 처리 후 종료
    joinIfRunning(execution_thread_);
    results_.close();

    joinIfRunning(result_thread_);
    notifications_.close();
    joinIfRunning(notification_thread_);

    LOG_INFO("[Pipeline] 종료 완료");
}

} // namespace core
} // namespace autocoin
