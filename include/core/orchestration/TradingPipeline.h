#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "agents/DecisionMaker.h"
#include "agents/ExecutionAgent.h"
#include "agents/RiskManager.h"
#include "agents/SignalDetector.h"
#include "common/Broadcast.h"
#include "common/Channel.h"
#include "exchange/IExchangeClient.h"
#include "notification/INotifier.h"
#include "notification/NotificationAgent.h"
#include "stream/MarketDataStream.h"

namespace autocoin {
namespace core {

struct PipelineOptions {
    std::vector<std::string> markets;
    std::size_t channel_capacity = 1000;
    std::size_t notification_capacity = 100;
};

struct PipelineComponents {
    std::unique_ptr<stream::MarketDataStream> stream;
    std::unique_ptr<agents::SignalDetector> signal_detector;
    std::shared_ptr<agents::DecisionMaker> decision_maker;
    std::unique_ptr<agents::RiskManager> risk_manager;
    std::unique_ptr<agents::ExecutionAgent> execution_agent;
    std::shared_ptr<exchange::IExchangeClient> exchange;
    std::shared_ptr<notification::INotifier> notifier;
};

// 스트림 -> {신호, 리스크} 팬아웃, {결정, 리스크} -> 실행 팬인
class TradingPipeline {
public:
    using ResultObserver = std::function<void(const OrderResult&)>;

    TradingPipeline(PipelineOptions options, PipelineComponents components);
    ~TradingPipeline();

    TradingPipeline(const TradingPipeline&) = delete;
    TradingPipeline& operator=(const TradingPipeline&) = delete;

    // start() 전에 등록. 결과 소비 스레드에서 호출된다
    void setResultObserver(ResultObserver observer);

    void start();

    // 상류부터 채널을 닫고 단계별 join. 남은 결정은 실행 에이전트가 모두 처리
    void stop();

    // 스트림이 끝나면(정상/치명) true. timeout이면 false
    bool waitForStreamEnd(std::chrono::milliseconds timeout);

    bool isRunning() const { return running_.load(); }
    bool streamFailed() const { return stream_failed_.load(); }

private:
    void runStream();
    void runResultConsumer();
    void refreshBalance();
    void alert(const std::string& title, const std::string& message);

    PipelineOptions options_;
    PipelineComponents components_;
    ResultObserver observer_;

    Broadcast<Tick> ticks_;
    std::shared_ptr<Channel<Tick>> signal_ticks_;
    std::shared_ptr<Channel<Tick>> risk_ticks_;
    Channel<Signal> signals_;
    Channel<Decision> decisions_;
    Channel<OrderResult> results_;
    Channel<OrderResult> notifications_;

    notification::NotificationAgent notification_agent_;

    std::thread stream_thread_;
    std::thread detector_thread_;
    std::thread decision_thread_;
    std::thread risk_thread_;
    std::thread execution_thread_;
    std::thread result_thread_;
    std::thread notification_thread_;

    std::atomic<bool> running_{false};
    std::atomic<bool> stream_failed_{false};

    std::mutex stream_mutex_;
    std::condition_variable stream_cv_;
    bool stream_done_ = false;
};

} // namespace core
} // namespace autocoin
