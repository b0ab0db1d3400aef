#include "agents/ExecutionAgent.h"

#include "common/Error.h"
#include "common/Logger.h"
#include "network/JwtGenerator.h"

#include <algorithm>
#include <thread>

namespace autocoin {
namespace agents {

namespace {
constexpr double kVolumeEpsilon = 1e-12;

template<class... Ts> struct Overloaded : Ts... { using Ts::operator()...; };
template<class... Ts> Overloaded(Ts...) -> Overloaded<Ts...>;
}

ExecutionAgent::ExecutionAgent(std::shared_ptr<exchange::IExchangeClient> exchange,
                               std::shared_ptr<storage::ITradeStore> store,
                               ExecutionOptions options,
                               Sleeper sleeper)
    : exchange_(std::move(exchange))
    , store_(std::move(store))
    , options_(options)
    , sleeper_(std::move(sleeper)) {}

void ExecutionAgent::sleep(std::chrono::milliseconds delay) {
    if (sleeper_) {
        sleeper_(delay);
    } else {
        std::this_thread::sleep_for(delay);
    }
}

Order ExecutionAgent::withRetry(const std::string& what, const std::function<Order()>& op) {
    int attempt = 0;
    while (true) {
        try {
            return op();
        } catch (const TradingError& e) {
            ++attempt;
            if (!e.isRetryable()) {
                throw;
            }
            if (attempt >= options_.max_retries) {
                LOG_ERROR("[Execution] {} 재시도 소진 ({}회): {}", what, attempt, e.what());
                throw TradingError(ErrorCode::MAX_RETRIES_EXCEEDED,
                                   "max retries exceeded: " + std::string(e.what()));
            }
            const auto delay = options_.retry_base_delay * (1LL << attempt);
            LOG_WARN("[Execution] {} 실패 ({}/{}): {} - {}ms 후 재시도",
                     what, attempt, options_.max_retries, e.what(), delay.count());
            sleep(delay);
        }
    }
}

std::optional<OrderResult> ExecutionAgent::execute(const Decision& decision) {
    return std::visit(Overloaded{
        [this](const BuyDecision& d) -> std::optional<OrderResult> { return executeBuy(d); },
        [this](const SellDecision& d) -> std::optional<OrderResult> { return executeSell(d); },
        [](const HoldDecision&) -> std::optional<OrderResult> { return std::nullopt; }
    }, decision);
}

OrderResult ExecutionAgent::executeBuy(const BuyDecision& decision) {
    // 단일 포지션 보장: 직렬화된 실행 단계에서 재확인
    if (!store_->getAllActivePositions().empty()) {
        LOG_WARN("[Execution] 매수 거부: 이미 포지션 보유 ({})", decision.market);
        return failure(decision.market, OrderSide::BID, decision.amount_quote, 0.0, "Position already exists");
    }
    // 미체결 주문이 남아 있으면 체결 결과가 확정될 때까지 신규 매수 보류
    if (!pendingOrders().empty()) {
        LOG_WARN("[Execution] 매수 거부: 미체결 주문 존재 ({})", decision.market);
        return failure(decision.market, OrderSide::BID, decision.amount_quote, 0.0, "Pending order not settled");
    }

    Order order;
    try {
        order = withRetry("매수 " + decision.market, [&] {
            return exchange_->buyMarketOrder(decision.market, decision.amount_quote);
        });
    } catch (const std::exception& e) {
        return failure(decision.market, OrderSide::BID, decision.amount_quote, 0.0, e.what());
    }

    if (order.executed_volume <= 0.0) {
        return notFilled(order);
    }

    return settleBuy(order);
}

OrderResult ExecutionAgent::settleBuy(const Order& order) {
    const Price avg_price = order.executed_amount / std::max(order.executed_volume, kVolumeEpsilon);

    Position position = Position::open(order.market, avg_price, order.executed_volume,
                                       options_.stop_loss_rate, options_.take_profit_rate);
    position.id = network::JwtGenerator::generateUUID();
    if (!store_->savePosition(position)) {
        LOG_ERROR("[Execution] 포지션 저장 실패 (체결은 유지): {}", order.market);
    }
    if (!store_->saveOrder(order)) {
        LOG_ERROR("[Execution] 주문 저장 실패: {}", order.id);
    }

    LOG_INFO("[Execution] 매수 체결: {} {:.8f} @ {:.2f} (SL {:.2f} / TP {:.2f})",
             order.market, order.executed_volume, avg_price, position.stop_loss, position.take_profit);
    Logger::getInstance().logTrade(order.market, "BUY", avg_price, order.executed_volume, 0.0);

    return OrderResult::succeeded(order);
}

OrderResult ExecutionAgent::executeSell(const SellDecision& decision) {
    for (const auto& pending : pendingOrders()) {
        if (pending.market == decision.market) {
            LOG_WARN("[Execution] 매도 보류: 미체결 주문 {} ({})", pending.id, decision.market);
            return failure(decision.market, OrderSide::ASK, 0.0, decision.amount, "Pending order not settled");
        }
    }

    Order order;
    try {
        order = withRetry("매도 " + decision.market, [&] {
            return exchange_->sellMarketOrder(decision.market, decision.amount);
        });
    } catch (const std::exception& e) {
        return failure(decision.market, OrderSide::ASK, 0.0, decision.amount, e.what());
    }

    if (order.executed_volume <= 0.0) {
        return notFilled(order);
    }

    return settleSell(order, decision.reason);
}

OrderResult ExecutionAgent::settleSell(const Order& order, const std::string& reason) {
    const Price exit_price = order.executed_amount / std::max(order.executed_volume, kVolumeEpsilon);

    double realized_pnl = 0.0;
    std::optional<double> realized_pnl_rate;
    auto position = store_->getActivePosition(order.market);
    if (position) {
        const PnL pnl = position->calculatePnl(exit_price);
        realized_pnl = pnl.profit;
        realized_pnl_rate = pnl.profit_rate;
        if (!store_->closePosition(order.market, exit_price, pnl.profit, pnl.profit_rate)) {
            LOG_ERROR("[Execution] 포지션 청산 기록 실패 (체결은 유지): {}", order.market);
        }
        LOG_INFO("[Execution] 매도 체결: {} {:.8f} @ {:.2f} - 손익 {:.0f} KRW ({:.2f}%) [{}]",
                 order.market, order.executed_volume, exit_price, pnl.profit,
                 pnl.profit_rate * 100.0, reason);
    } else {
        LOG_WARN("[Execution] 매도 체결되었으나 활성 포지션 없음: {}", order.market);
    }

    if (!store_->saveOrder(order)) {
        LOG_ERROR("[Execution] 주문 저장 실패: {}", order.id);
    }
    Logger::getInstance().logTrade(order.market, "SELL", exit_price, order.executed_volume, realized_pnl);

    auto result = OrderResult::succeeded(order);
    if (realized_pnl_rate) {
        result.realized_pnl = realized_pnl;
        result.realized_pnl_rate = realized_pnl_rate;
    }
    return result;
}

OrderResult ExecutionAgent::failure(const std::string& market, OrderSide side,
                                    Price price, Volume volume, const std::string& error) {
    LOG_ERROR("[Execution] 주문 실패 {} {}: {}", market, toString(side), error);

    auto result = OrderResult::failed(market, side, error);
    result.order.id = network::JwtGenerator::generateUUID();
    result.order.price = price;
    result.order.volume = volume;
    if (!store_->saveOrder(result.order)) {
        LOG_ERROR("[Execution] 실패 주문 저장 실패: {}", result.order.id);
    }
    return result;
}

OrderResult ExecutionAgent::notFilled(const Order& order) {
    LOG_WARN("[Execution] 주문 {} 미체결 (상태 {})", order.id, toString(order.status));
    if (!store_->saveOrder(order)) {
        LOG_ERROR("[Execution] 주문 저장 실패: {}", order.id);
    }

    OrderResult result;
    result.order = order;
    result.success = false;
    result.error = std::string("order not filled (") + toString(order.status) + ")";
    return result;
}

Order ExecutionAgent::checkOrderStatus(const std::string& order_id) {
    return exchange_->getOrder(order_id);
}

std::vector<Order> ExecutionAgent::pendingOrders() {
    std::vector<Order> pending;
    for (auto& order : store_->getOrders()) {
        if (order.status == OrderStatus::WAITING) {
            pending.push_back(std::move(order));
        }
    }
    return pending;
}

std::vector<OrderResult> ExecutionAgent::reconcilePendingOrders() {
    std::vector<OrderResult> results;

    for (const auto& pending : pendingOrders()) {
        Order latest;
        try {
            latest = exchange_->getOrder(pending.id);
        } catch (const TradingError& e) {
            if (e.isRetryable()) {
                LOG_WARN("[Execution] 미체결 주문 {} 조회 실패, 다음 주기에 재시도: {}", pending.id, e.what());
                continue;
            }
            // 거래소가 주문을 인정하지 않으면 더 기다려도 확정되지 않는다
            LOG_ERROR("[Execution] 미체결 주문 {} 조회 불가 - 실패 처리: {}", pending.id, e.what());
            Order failed = pending;
            failed.status = OrderStatus::FAILED;
            if (!store_->saveOrder(failed)) {
                LOG_ERROR("[Execution] 주문 저장 실패: {}", failed.id);
            }
            continue;
        }

        // 조회 응답에 빠질 수 있는 필드는 원 주문 값 유지
        latest.id = pending.id;
        latest.side = pending.side;
        if (latest.market.empty()) {
            latest.market = pending.market;
        }
        if (latest.created_at == 0) {
            latest.created_at = pending.created_at;
        }

        if (latest.status == OrderStatus::WAITING) {
            continue;
        }

        if (latest.executed_volume <= 0.0) {
            LOG_WARN("[Execution] 미체결 주문 {} 체결 없이 종료 ({})", latest.id, toString(latest.status));
            if (!store_->saveOrder(latest)) {
                LOG_ERROR("[Execution] 주문 저장 실패: {}", latest.id);
            }
            continue;
        }

        if (latest.side == OrderSide::BID) {
            auto position = store_->getActivePosition(latest.market);
            if (position) {
                // 부분 체결로 이미 연 포지션: 최종 체결분으로 갱신
                const Price avg_price = latest.executed_amount / std::max(latest.executed_volume, kVolumeEpsilon);
                Position updated = Position::open(latest.market, avg_price, latest.executed_volume,
                                                  options_.stop_loss_rate, options_.take_profit_rate);
                updated.id = position->id;
                updated.entry_time = position->entry_time;
                if (!store_->savePosition(updated)) {
                    LOG_ERROR("[Execution] 포지션 갱신 실패: {}", latest.market);
                }
                if (!store_->saveOrder(latest)) {
                    LOG_ERROR("[Execution] 주문 저장 실패: {}", latest.id);
                }
                LOG_INFO("[Execution] 매수 최종 체결 반영: {} {:.8f} @ {:.2f}",
                         latest.market, latest.executed_volume, avg_price);
                continue;
            }
            results.push_back(settleBuy(latest));
        } else {
            results.push_back(settleSell(latest, "reconciled"));
        }
    }

    return results;
}

void ExecutionAgent::run(Channel<Decision>& in, ISender<OrderResult>& out) {
    LOG_INFO("[Execution] 시작 (max retries {}, base delay {}ms)",
             options_.max_retries, options_.retry_base_delay.count());

    auto publish = [&out](OrderResult result) {
        if (!out.send(std::move(result))) {
            LOG_WARN("[Execution] 결과 채널 닫힘");
        }
    };

    while (true) {
        auto decision = in.receiveFor(options_.reconcile_interval);
        if (!decision) {
            if (in.isClosed() && in.size() == 0) {
                break;
            }
            for (auto& settled : reconcilePendingOrders()) {
                publish(std::move(settled));
            }
            continue;
        }

        if (!std::holds_alternative<HoldDecision>(*decision)) {
            for (auto& settled : reconcilePendingOrders()) {
                publish(std::move(settled));
            }
        }

        auto result = execute(*decision);
        if (result) {
            publish(std::move(*result));
        }
    }
    LOG_INFO("[Execution] 결정 채널 종료 - 실행 에이전트 종료");
}

} // namespace agents
} // namespace autocoin
