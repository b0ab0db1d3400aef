#include "agents/RiskManager.h"

#include "common/Logger.h"

namespace autocoin {
namespace agents {

RiskManager::RiskManager(std::shared_ptr<storage::ITradeStore> store, RiskOptions options)
    : store_(std::move(store))
    , options_(options) {}

std::optional<Decision> RiskManager::evaluate(const Position& position, Price price) {
    if (position.shouldStopLoss(price)) {
        return Decision{SellDecision{position.market, position.amount, "stop loss triggered"}};
    }
    if (position.shouldTakeProfit(price)) {
        return Decision{SellDecision{position.market, position.amount, "take profit reached"}};
    }
    return std::nullopt;
}

std::string RiskManager::positionKey(const Position& position) {
    if (!position.id.empty()) {
        return position.id;
    }
    return position.market + "@" + std::to_string(position.entry_time);
}

void RiskManager::start() {
    refreshPosition();
    if (position_) {
        LOG_INFO("[RiskManager] 감시 포지션: {} entry {:.2f} SL {:.2f} TP {:.2f}",
                 position_->market, position_->entry_price, position_->stop_loss, position_->take_profit);
    } else {
        LOG_INFO("[RiskManager] 활성 포지션 없음");
    }
}

void RiskManager::refreshPosition() {
    last_refresh_ = Clock::now();
    loaded_ = true;

    auto active = store_->getAllActivePositions();
    if (active.size() > 1) {
        LOG_ERROR("[RiskManager] 활성 포지션 {}건 발견 - 첫 번째({})만 감시", active.size(), active.front().market);
    }

    std::optional<Position> next;
    if (!active.empty()) {
        next = active.front();
    }

    if (next && (!position_ || positionKey(*position_) != positionKey(*next))) {
        LOG_INFO("[RiskManager] 새 포지션 감시 시작: {} {:.8f} @ {:.2f}",
                 next->market, next->amount, next->entry_price);
    }
    position_ = std::move(next);
}

std::optional<Decision> RiskManager::onTick(const Tick& tick) {
    if (!loaded_ || Clock::now() - last_refresh_ >= options_.position_refresh) {
        refreshPosition();
    }

    if (!position_ || tick.market != position_->market) {
        return std::nullopt;
    }

    const PnL pnl = position_->calculatePnl(tick.trade_price);
    LOG_DEBUG("[RiskManager] {} price {:.2f} pnl {:.0f} ({:.2f}%)",
              tick.market, tick.trade_price, pnl.profit, pnl.profit_rate * 100.0);

    auto decision = evaluate(*position_, tick.trade_price);
    if (!decision) {
        return std::nullopt;
    }

    const auto now = Clock::now();
    const std::string key = positionKey(*position_);
    if (key == last_exit_key_ && now - last_exit_time_ < options_.exit_retry) {
        return std::nullopt;
    }
    last_exit_key_ = key;
    last_exit_time_ = now;

    LOG_WARN("[RiskManager] {} {} @ {:.2f} (pnl {:.2f}%)",
             tick.market, std::get<SellDecision>(*decision).reason, tick.trade_price, pnl.profit_rate * 100.0);
    return decision;
}

void RiskManager::run(Channel<Tick>& in, ISender<Decision>& out) {
    start();

    while (auto tick = in.receive()) {
        auto decision = onTick(*tick);
        if (!decision) {
            continue;
        }
        if (!out.send(std::move(*decision))) {
            LOG_WARN("[RiskManager] 결정 채널 닫힘 - 종료");
            return;
        }
    }
    LOG_INFO("[RiskManager] 입력 종료");
}

} // namespace agents
} // namespace autocoin
