#include "execution/OrderStateMapper.h"
#include "TestFakes.h"

#include <cassert>
#include <iostream>

using namespace autocoin;
using autocoin::execution::OrderStateMapper;
using autocoin::testing::near;

int main() {
    // 상태 매핑
    {
        auto done = OrderStateMapper::map("done", 1.0);
        assert(done.status == OrderStatus::EXECUTED && done.terminal);

        auto wait = OrderStateMapper::map("wait", 0.0);
        assert(wait.status == OrderStatus::WAITING && !wait.terminal);
        assert(OrderStateMapper::map("WATCH", 0.0).status == OrderStatus::WAITING);

        // 시장가 매수 잔량 취소는 체결로 본다
        assert(OrderStateMapper::map("cancel", 0.3).status == OrderStatus::EXECUTED);
        auto canceled = OrderStateMapper::map("cancel", 0.0);
        assert(canceled.status == OrderStatus::CANCELED && canceled.terminal);

        assert(OrderStateMapper::map("weird", 0.0).status == OrderStatus::FAILED);
    }

    // 문자열 숫자 + trades 합계
    {
        auto j = nlohmann::json::parse(R"({
            "uuid": "abc-123",
            "side": "bid",
            "ord_type": "price",
            "price": "50000",
            "state": "cancel",
            "market": "KRW-BTC",
            "created_at": "2024-01-02T03:04:05+09:00",
            "volume": null,
            "executed_volume": "0.49",
            "trades": [
                {"price": "100000", "volume": "0.29", "funds": "29000"},
                {"price": "100000", "volume": "0.2", "funds": "20000"}
            ]
        })");
        Order order = OrderStateMapper::fromJson(j);
        assert(order.id == "abc-123");
        assert(order.market == "KRW-BTC");
        assert(order.side == OrderSide::BID);
        assert(near(order.price, 50000.0));
        assert(near(order.executed_volume, 0.49));
        assert(near(order.executed_amount, 49000.0));
        assert(near(order.volume, 0.49));
        assert(order.status == OrderStatus::EXECUTED);
        assert(order.created_at == OrderStateMapper::parseTimestampMs("2024-01-01T18:04:05Z"));
        assert(near(order.averageExecutedPrice(), 100000.0));
    }

    // executed_funds 사용
    {
        auto j = nlohmann::json::parse(R"({
            "uuid": "sell-1", "side": "ask", "state": "done", "market": "KRW-BTC",
            "volume": "0.5", "executed_volume": "0.5", "executed_funds": "47000"
        })");
        Order order = OrderStateMapper::fromJson(j);
        assert(order.side == OrderSide::ASK);
        assert(near(order.executed_amount, 47000.0));
        assert(order.isExecuted());
        assert(order.created_at > 0);
    }

    // 대기 중 주문
    {
        auto j = nlohmann::json::parse(R"({"uuid": "w", "side": "bid", "state": "wait", "price": 1000})");
        Order order = OrderStateMapper::fromJson(j);
        assert(order.isWaiting());
        assert(near(order.executed_amount, 0.0));
    }

    // 타임스탬프
    assert(OrderStateMapper::parseTimestampMs("1970-01-01T09:00:00+09:00") == 0);
    assert(OrderStateMapper::parseTimestampMs("1970-01-01T00:00:01Z") == 1000);
    assert(OrderStateMapper::parseTimestampMs("1970-01-01T00:00:00-01:00") == 3600000);
    assert(OrderStateMapper::parseTimestampMs("not a date") == 0);

    std::cout << "[TEST] OrderStateMapper PASSED\n";
    return 0;
}
