#include "common/Types.h"

#include <algorithm>
#include <sstream>
#include <iomanip>

namespace autocoin {

namespace {
template<class... Ts> struct Overloaded : Ts... { using Ts::operator()...; };
template<class... Ts> Overloaded(Ts...) -> Overloaded<Ts...>;
}

long long nowMs() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()
    ).count();
}

Signal Signal::buy(std::string market, double confidence, std::string reason) {
    Signal s;
    s.market = std::move(market);
    s.kind = SignalKind::BUY;
    s.confidence = confidence;
    s.reason = std::move(reason);
    s.timestamp = nowMs();
    return s;
}

Signal Signal::sell(std::string market, double confidence, std::string reason) {
    Signal s;
    s.market = std::move(market);
    s.kind = SignalKind::SELL;
    s.confidence = confidence;
    s.reason = std::move(reason);
    s.timestamp = nowMs();
    return s;
}

Signal Signal::hold(std::string market) {
    Signal s;
    s.market = std::move(market);
    s.kind = SignalKind::HOLD;
    s.confidence = 0.0;
    s.reason = "No significant signal";
    s.timestamp = nowMs();
    return s;
}

bool isTrade(const Decision& decision) {
    return !std::holds_alternative<HoldDecision>(decision);
}

std::string describe(const Decision& decision) {
    return std::visit(Overloaded{
        [](const BuyDecision& d) {
            std::ostringstream oss;
            oss << "BUY " << d.market << " " << std::fixed << std::setprecision(0)
                << d.amount_quote << " KRW";
            return oss.str();
        },
        [](const SellDecision& d) {
            std::ostringstream oss;
            oss << "SELL " << d.market << " " << std::fixed << std::setprecision(8) << d.amount;
            return oss.str();
        },
        [](const HoldDecision& d) {
            return "HOLD (" + d.reason + ")";
        }
    }, decision);
}

Position Position::open(std::string market, Price entry_price, Volume amount,
                        double stop_loss_rate, double take_profit_rate) {
    Position p;
    p.market = std::move(market);
    p.entry_price = entry_price;
    p.amount = amount;
    p.entry_time = nowMs();
    p.stop_loss = entry_price * (1.0 - stop_loss_rate);
    p.take_profit = entry_price * (1.0 + take_profit_rate);
    p.status = PositionStatus::ACTIVE;
    return p;
}

PnL Position::calculatePnl(Price current_price) const {
    PnL pnl;
    pnl.cost = amount * entry_price;
    pnl.value = amount * current_price;
    pnl.profit = pnl.value - pnl.cost;
    pnl.profit_rate = (entry_price > 0.0) ? (current_price / entry_price) - 1.0 : 0.0;
    return pnl;
}

Price Order::averageExecutedPrice() const {
    if (executed_volume > 0.0) {
        return executed_amount / executed_volume;
    }
    return price;
}

OrderResult OrderResult::succeeded(Order order) {
    OrderResult r;
    r.order = std::move(order);
    r.success = true;
    r.executed_at = nowMs();
    return r;
}

OrderResult OrderResult::failed(const std::string& market, OrderSide side, const std::string& error) {
    OrderResult r;
    r.order.market = market;
    r.order.side = side;
    r.order.status = OrderStatus::FAILED;
    r.order.created_at = nowMs();
    r.success = false;
    r.error = error;
    return r;
}

const char* toString(OrderSide side) {
    switch (side) {
        case OrderSide::BID: return "bid";
        case OrderSide::ASK: return "ask";
    }
    return "bid";
}

const char* toString(OrderStatus status) {
    switch (status) {
        case OrderStatus::WAITING: return "waiting";
        case OrderStatus::EXECUTED: return "executed";
        case OrderStatus::CANCELED: return "canceled";
        case OrderStatus::FAILED: return "failed";
    }
    return "failed";
}

const char* toString(SignalKind kind) {
    switch (kind) {
        case SignalKind::BUY: return "BUY";
        case SignalKind::STRONG_BUY: return "STRONG_BUY";
        case SignalKind::SELL: return "SELL";
        case SignalKind::STRONG_SELL: return "STRONG_SELL";
        case SignalKind::HOLD: return "HOLD";
    }
    return "HOLD";
}

const char* toString(PositionStatus status) {
    return status == PositionStatus::ACTIVE ? "active" : "closed";
}

OrderSide orderSideFromString(const std::string& value) {
    return value == "ask" ? OrderSide::ASK : OrderSide::BID;
}

OrderStatus orderStatusFromString(const std::string& value) {
    if (value == "waiting") return OrderStatus::WAITING;
    if (value == "executed") return OrderStatus::EXECUTED;
    if (value == "canceled") return OrderStatus::CANCELED;
    return OrderStatus::FAILED;
}

PositionStatus positionStatusFromString(const std::string& value) {
    return value == "closed" ? PositionStatus::CLOSED : PositionStatus::ACTIVE;
}

} // namespace autocoin
