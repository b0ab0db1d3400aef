#include "agents/DecisionMaker.h"

#include "common/Logger.h"

namespace autocoin {
namespace agents {

namespace {
// 잔고 대비 이 비율을 넘는 주문은 경고만 남긴다
constexpr double kLargeOrderRatio = 0.5;
}

DecisionMaker::DecisionMaker(const TradingConfig& config, std::shared_ptr<storage::ITradeStore> store)
    : min_order_amount_(config.min_order_amount)
    , max_position_ratio_(config.max_position_ratio)
    , store_(std::move(store)) {}

void DecisionMaker::setBalance(Amount balance) {
    std::lock_guard<std::mutex> lock(balance_mutex_);
    balance_ = balance;
}

Amount DecisionMaker::balance() const {
    std::lock_guard<std::mutex> lock(balance_mutex_);
    return balance_;
}

Decision DecisionMaker::decide(const Signal& signal) {
    switch (signal.kind) {
        case SignalKind::BUY:
        case SignalKind::STRONG_BUY:
            return decideBuy(signal);
        case SignalKind::SELL:
        case SignalKind::STRONG_SELL:
            return decideSell(signal);
        case SignalKind::HOLD:
            break;
    }
    return HoldDecision{"No significant signal"};
}

Decision DecisionMaker::decideBuy(const Signal& signal) {
    if (!store_->getAllActivePositions().empty()) {
        return HoldDecision{"Position already exists"};
    }

    const Amount available = balance();
    if (available < min_order_amount_) {
        return HoldDecision{"Insufficient balance"};
    }

    const Amount order_amount = available * max_position_ratio_;
    if (order_amount > available * kLargeOrderRatio) {
        LOG_WARN("[DecisionMaker] 큰 주문: {:.0f} KRW (잔고 {:.0f} KRW의 {:.0f}%)",
                 order_amount, available, max_position_ratio_ * 100.0);
    }

    return BuyDecision{signal.market, order_amount, signal.reason};
}

Decision DecisionMaker::decideSell(const Signal& signal) {
    auto position = store_->getActivePosition(signal.market);
    if (!position) {
        return HoldDecision{"No matching position to sell"};
    }
    return SellDecision{signal.market, position->amount, signal.reason};
}

void DecisionMaker::run(Channel<Signal>& in, ISender<Decision>& out) {
    LOG_INFO("[DecisionMaker] 시작 (min order {:.0f} KRW, ratio {:.2f})",
             min_order_amount_, max_position_ratio_);

    while (auto signal = in.receive()) {
        Decision decision = decide(*signal);
        if (isTrade(decision)) {
            LOG_INFO("[DecisionMaker] {} <- {}", describe(decision), signal->reason);
        } else {
            LOG_DEBUG("[DecisionMaker] {} ({})", describe(decision), signal->market);
        }
        if (!out.send(std::move(decision))) {
            LOG_WARN("[DecisionMaker] 결정 채널 닫힘 - 종료");
            return;
        }
    }
    LOG_INFO("[DecisionMaker] 입력 종료");
}

} // namespace agents
} // namespace autocoin
