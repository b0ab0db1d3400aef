#pragma once

#include <string>
#include <vector>
#include <chrono>
#include <optional>
#include <variant>

namespace autocoin {

using Timestamp = std::chrono::system_clock::time_point;
using Price = double;
using Volume = double;
using Amount = double;

// 손절/익절 경계 비교용 상대 오차
constexpr double kPriceTolerance = 1e-9;

enum class OrderSide { BID, ASK };
enum class OrderStatus { WAITING, EXECUTED, CANCELED, FAILED };
enum class SignalKind { BUY, STRONG_BUY, SELL, STRONG_SELL, HOLD };
enum class PositionStatus { ACTIVE, CLOSED };

long long nowMs();

// 실시간 체결/현재가 1건
struct Tick {
    std::string market;
    long long timestamp = 0;    // ms
    Price trade_price = 0.0;
    double change_rate = 0.0;
    Volume volume = 0.0;
    Amount trade_amount = 0.0;
};

struct Signal {
    std::string market;
    SignalKind kind = SignalKind::HOLD;
    double confidence = 0.0;    // 0.0 ~ 1.0
    std::string reason;
    long long timestamp = 0;

    static Signal buy(std::string market, double confidence, std::string reason);
    static Signal sell(std::string market, double confidence, std::string reason);
    static Signal hold(std::string market);
};

// ===== Decision (closed sum type) =====

struct BuyDecision {
    std::string market;
    Amount amount_quote = 0.0;  // KRW
    std::string reason;
};

struct SellDecision {
    std::string market;
    Volume amount = 0.0;
    std::string reason;
};

struct HoldDecision {
    std::string reason;
};

using Decision = std::variant<BuyDecision, SellDecision, HoldDecision>;

bool isTrade(const Decision& decision);
std::string describe(const Decision& decision);

struct PnL {
    Amount cost = 0.0;
    Amount value = 0.0;
    Amount profit = 0.0;
    double profit_rate = 0.0;
};

struct Position {
    std::string id;
    std::string market;
    Price entry_price = 0.0;
    Volume amount = 0.0;
    long long entry_time = 0;   // ms
    Price stop_loss = 0.0;
    Price take_profit = 0.0;

    PositionStatus status = PositionStatus::ACTIVE;
    std::optional<Price> exit_price;
    std::optional<long long> exit_time;
    std::optional<Amount> pnl;
    std::optional<double> pnl_rate;

    // 손절/익절가는 진입 시점에 고정
    static Position open(std::string market, Price entry_price, Volume amount,
                         double stop_loss_rate, double take_profit_rate);

    PnL calculatePnl(Price current_price) const;
    // 경계가 entry * (1 ± rate)로 계산되므로 가격이 정확히 경계와 같으면 발동 (상대 오차 허용)
    bool shouldStopLoss(Price current_price) const {
        return current_price <= stop_loss * (1.0 + kPriceTolerance);
    }
    bool shouldTakeProfit(Price current_price) const {
        return current_price >= take_profit * (1.0 - kPriceTolerance);
    }
};

struct Order {
    std::string id;
    std::string market;
    OrderSide side = OrderSide::BID;
    Price price = 0.0;
    Volume volume = 0.0;
    OrderStatus status = OrderStatus::WAITING;
    long long created_at = 0;   // ms
    Volume executed_volume = 0.0;
    Amount executed_amount = 0.0;

    bool isExecuted() const { return status == OrderStatus::EXECUTED; }
    bool isWaiting() const { return status == OrderStatus::WAITING; }

    // 체결 평균가 (체결 수량이 없으면 주문가)
    Price averageExecutedPrice() const;
};

struct OrderResult {
    Order order;
    bool success = false;
    std::optional<std::string> error;
    std::optional<long long> executed_at;
    std::optional<Amount> realized_pnl;       // 매도 체결 시
    std::optional<double> realized_pnl_rate;

    static OrderResult succeeded(Order order);
    static OrderResult failed(const std::string& market, OrderSide side, const std::string& error);
};

struct Balance {
    std::string currency;
    Amount balance = 0.0;
    Amount locked = 0.0;
    Price avg_buy_price = 0.0;

    Amount available() const { return balance - locked; }
};

const char* toString(OrderSide side);
const char* toString(OrderStatus status);
const char* toString(SignalKind kind);
const char* toString(PositionStatus status);

OrderSide orderSideFromString(const std::string& value);
OrderStatus orderStatusFromString(const std::string& value);
PositionStatus positionStatusFromString(const std::string& value);

} // namespace autocoin
