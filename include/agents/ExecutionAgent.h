#pragma once

#include "common/Channel.h"
#include "common/Types.h"
#include "exchange/IExchangeClient.h"
#include "storage/ITradeStore.h"

#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace autocoin {
namespace agents {

struct ExecutionOptions {
    int max_retries = 3;                                 // 총 시도 횟수
    std::chrono::milliseconds retry_base_delay{1000};    // base * 2^attempt
    double take_profit_rate = 0.10;
    double stop_loss_rate = 0.05;
    std::chrono::milliseconds reconcile_interval{5000};  // 미체결 주문 재조회 주기 (run)
};

// 결정 -> 거래소 주문 (재시도/백오프) -> 포지션/주문 저장 -> OrderResult
class ExecutionAgent {
public:
    using Sleeper = std::function<void(std::chrono::milliseconds)>;

    ExecutionAgent(std::shared_ptr<exchange::IExchangeClient> exchange,
                   std::shared_ptr<storage::ITradeStore> store,
                   ExecutionOptions options,
                   Sleeper sleeper = {});

    // Hold는 nullopt. 그 외에는 성공/실패 결과를 반드시 반환
    std::optional<OrderResult> execute(const Decision& decision);

    // in이 닫히고 비워질 때까지 처리 (진행 중 재시도 포함)
    void run(Channel<Decision>& in, ISender<OrderResult>& out);

    Order checkOrderStatus(const std::string& order_id);

    // 저장된 WAITING 주문을 거래소에서 재조회해 체결분을 포지션에 반영.
    // 새로 체결 확정된 주문마다 결과 1건
    std::vector<OrderResult> reconcilePendingOrders();

private:
    OrderResult executeBuy(const BuyDecision& decision);
    OrderResult executeSell(const SellDecision& decision);

    OrderResult failure(const std::string& market, OrderSide side,
                        Price price, Volume volume, const std::string& error);
    OrderResult notFilled(const Order& order);

    std::vector<Order> pendingOrders();
    OrderResult settleBuy(const Order& order);
    OrderResult settleSell(const Order& order, const std::string& reason);

    // 재시도 가능한 오류는 base * 2^attempt 대기 후 재시도, 소진 시 MAX_RETRIES_EXCEEDED
    Order withRetry(const std::string& what, const std::function<Order()>& op);

    void sleep(std::chrono::milliseconds delay);

    std::shared_ptr<exchange::IExchangeClient> exchange_;
    std::shared_ptr<storage::ITradeStore> store_;
    ExecutionOptions options_;
    Sleeper sleeper_;
};

} // namespace agents
} // namespace autocoin
