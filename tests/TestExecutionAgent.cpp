#include "agents/ExecutionAgent.h"
#include "TestFakes.h"

#include <cassert>
#include <iostream>
#include <memory>
#include <thread>
#include <vector>

using namespace autocoin;
using autocoin::agents::ExecutionAgent;
using autocoin::agents::ExecutionOptions;
using autocoin::testing::FakeExchange;
using autocoin::testing::MemoryTradeStore;
using autocoin::testing::near;

namespace {
ExecutionOptions defaultOptions() {
    ExecutionOptions options;
    options.max_retries = 3;
    options.retry_base_delay = std::chrono::milliseconds(1000);
    options.take_profit_rate = 0.10;
    options.stop_loss_rate = 0.05;
    return options;
}

struct Fixture {
    std::shared_ptr<FakeExchange> exchange = std::make_shared<FakeExchange>();
    std::shared_ptr<MemoryTradeStore> store = std::make_shared<MemoryTradeStore>();
    std::vector<long long> sleeps;
    ExecutionAgent agent;

    explicit Fixture(ExecutionOptions options = defaultOptions())
        : agent(exchange, store, options,
                [this](std::chrono::milliseconds d) { sleeps.push_back(d.count()); }) {}
};
}

int main() {
    // 429, 네트워크 오류 후 성공: 2s, 4s 대기
    {
        Fixture f;
        f.exchange->buy_errors = {ErrorCode::RATE_LIMITED, ErrorCode::NETWORK};
        auto result = f.agent.execute(BuyDecision{"KRW-BTC", 50000.0, "surge"});
        assert(result.has_value());
        assert(result->success);
        assert(f.exchange->buy_calls == 3);
        assert((f.sleeps == std::vector<long long>{2000, 4000}));

        auto positions = f.store->snapshotPositions();
        assert(positions.size() == 1);
        const auto& p = positions.front();
        assert(p.status == PositionStatus::ACTIVE);
        assert(!p.id.empty());
        assert(near(p.entry_price, 100000.0));
        assert(near(p.amount, 0.5));
        assert(near(p.stop_loss, 95000.0));
        assert(near(p.take_profit, 110000.0));
        assert(f.store->orders.size() == 1);
        assert(f.store->orders.front().id == "buy-3");
    }

    // 재시도 소진
    {
        Fixture f;
        f.exchange->buy_errors = {ErrorCode::TIMEOUT, ErrorCode::TIMEOUT, ErrorCode::TIMEOUT};
        auto result = f.agent.execute(BuyDecision{"KRW-BTC", 50000.0, "surge"});
        assert(result.has_value());
        assert(!result->success);
        assert(result->error->find("max retries exceeded") == 0);
        assert(f.exchange->buy_calls == 3);
        assert((f.sleeps == std::vector<long long>{2000, 4000}));
        assert(f.store->positions.empty());
        assert(f.store->orders.size() == 1);
        assert(f.store->orders.front().status == OrderStatus::FAILED);
    }

    // 재시도 불가 오류는 즉시 실패 + 실패 주문 기록
    {
        Fixture f;
        f.exchange->buy_errors = {ErrorCode::INVALID_CREDENTIALS};
        auto result = f.agent.execute(BuyDecision{"KRW-BTC", 50000.0, "surge"});
        assert(result.has_value());
        assert(!result->success);
        assert(result->order.status == OrderStatus::FAILED);
        assert(!result->order.id.empty());
        assert(near(result->order.price, 50000.0));
        assert(f.exchange->buy_calls == 1);
        assert(f.sleeps.empty());
        assert(f.store->orders.size() == 1);
        assert(f.store->positions.empty());
    }

    // 이미 포지션이 있으면 거래소 호출 없이 실패
    {
        Fixture f;
        f.store->positions.push_back(Position::open("KRW-ETH", 1000.0, 1.0, 0.05, 0.1));
        auto result = f.agent.execute(BuyDecision{"KRW-BTC", 50000.0, "surge"});
        assert(result.has_value());
        assert(!result->success);
        assert(*result->error == "Position already exists");
        assert(f.exchange->buy_calls == 0);
    }

    // 매도: 포지션 청산 + 실현 손익
    {
        Fixture f;
        auto position = Position::open("KRW-BTC", 100000.0, 0.5, 0.05, 0.10);
        position.id = "pos-1";
        f.store->positions.push_back(position);
        f.exchange->fill_price = 94000.0;

        auto result = f.agent.execute(SellDecision{"KRW-BTC", 0.5, "stop loss triggered"});
        assert(result.has_value());
        assert(result->success);
        assert(result->order.side == OrderSide::ASK);
        assert(result->realized_pnl.has_value());
        assert(near(*result->realized_pnl, -3000.0));
        assert(near(*result->realized_pnl_rate, -0.06));

        const auto& closed = f.store->positions.front();
        assert(closed.status == PositionStatus::CLOSED);
        assert(near(*closed.exit_price, 94000.0));
        assert(near(*closed.pnl, -3000.0));
        assert(!f.store->getActivePosition("KRW-BTC"));
    }

    // 저장소 쓰기 실패: 체결은 성공으로 보고, 메모리상 포지션은 유지
    {
        Fixture f;
        f.store->fail_writes = true;
        auto bought = f.agent.execute(BuyDecision{"KRW-BTC", 50000.0, "surge"});
        assert(bought.has_value());
        assert(bought->success);
        assert(f.store->getActivePosition("KRW-BTC").has_value());
        assert(f.store->orders.size() == 1);

        f.exchange->fill_price = 110000.0;
        auto sold = f.agent.execute(SellDecision{"KRW-BTC", 0.5, "take profit reached"});
        assert(sold.has_value());
        assert(sold->success);
        assert(near(*sold->realized_pnl, 5000.0));
        assert(!f.store->getActivePosition("KRW-BTC"));
        assert(f.store->orders.size() == 2);
    }

    // 접수만 되고 체결 0: 미체결 결과 + WAITING 주문 저장, 포지션 없음
    {
        Fixture f;
        f.exchange->hold_fills = true;
        auto result = f.agent.execute(BuyDecision{"KRW-BTC", 50000.0, "surge"});
        assert(result.has_value());
        assert(!result->success);
        assert(*result->error == "order not filled (waiting)");
        assert(result->order.id == "buy-1");
        assert(f.store->positions.empty());
        assert(f.store->orders.size() == 1);
        assert(f.store->orders.front().status == OrderStatus::WAITING);

        // 미체결 주문이 남아 있는 동안 신규 매수는 거래소 호출 없이 거부
        auto second = f.agent.execute(BuyDecision{"KRW-BTC", 50000.0, "surge"});
        assert(second.has_value());
        assert(!second->success);
        assert(*second->error == "Pending order not settled");
        assert(f.exchange->buy_calls == 1);

        // 아직 체결 전이면 재조회해도 변화 없음
        assert(f.agent.reconcilePendingOrders().empty());
        assert(f.store->positions.empty());

        // 조회 일시 장애는 다음 주기로 미룸
        f.exchange->hold_fills = false;
        f.exchange->query_errors = {ErrorCode::NETWORK};
        assert(f.agent.reconcilePendingOrders().empty());

        // 체결 확인 후 포지션 반영
        auto settled = f.agent.reconcilePendingOrders();
        assert(settled.size() == 1);
        assert(settled.front().success);
        assert(settled.front().order.id == "buy-1");
        assert(settled.front().order.side == OrderSide::BID);
        auto position = f.store->getActivePosition("KRW-BTC");
        assert(position.has_value());
        assert(near(position->entry_price, 100000.0));
        assert(near(position->amount, 0.5));
        assert(near(position->take_profit, 110000.0));
        assert(f.agent.reconcilePendingOrders().empty());

        // 정산 뒤에는 다시 매수 가능 (단일 포지션 제한만 적용)
        auto third = f.agent.execute(BuyDecision{"KRW-ETH", 50000.0, "surge"});
        assert(*third->error == "Position already exists");
    }

    // 매도 접수 후 나중에 체결: 재조회 시 청산 + 실현 손익
    {
        Fixture f;
        auto position = Position::open("KRW-BTC", 100000.0, 0.5, 0.05, 0.10);
        position.id = "pos-1";
        f.store->positions.push_back(position);
        f.exchange->fill_price = 94000.0;
        f.exchange->hold_fills = true;

        auto result = f.agent.execute(SellDecision{"KRW-BTC", 0.5, "stop loss triggered"});
        assert(!result->success);
        assert(f.store->getActivePosition("KRW-BTC").has_value());

        auto again = f.agent.execute(SellDecision{"KRW-BTC", 0.5, "stop loss triggered"});
        assert(*again->error == "Pending order not settled");
        assert(f.exchange->sell_calls == 1);

        f.exchange->hold_fills = false;
        auto settled = f.agent.reconcilePendingOrders();
        assert(settled.size() == 1);
        assert(settled.front().order.side == OrderSide::ASK);
        assert(near(*settled.front().realized_pnl, -3000.0));
        assert(!f.store->getActivePosition("KRW-BTC"));
    }

    // 거래소가 주문을 모르면 실패 처리해 매수를 다시 허용
    {
        Fixture f;
        f.exchange->hold_fills = true;
        f.agent.execute(BuyDecision{"KRW-BTC", 50000.0, "surge"});
        f.exchange->query_errors = {ErrorCode::API_ERROR};
        assert(f.agent.reconcilePendingOrders().empty());
        assert(f.store->orders.front().status == OrderStatus::FAILED);

        f.exchange->hold_fills = false;
        auto result = f.agent.execute(BuyDecision{"KRW-BTC", 50000.0, "surge"});
        assert(result->success);
        assert(f.exchange->buy_calls == 2);
    }

    // 주문 상태 조회
    {
        Fixture f;
        Order o = f.agent.checkOrderStatus("buy-1");
        assert(o.id == "buy-1");
        assert(o.isExecuted());
    }

    // Hold는 결과 없음
    {
        Fixture f;
        assert(!f.agent.execute(HoldDecision{"No significant signal"}));
        assert(f.exchange->buy_calls == 0);
        assert(f.exchange->sell_calls == 0);
    }

    // run: 결정 채널이 닫히면 남은 결정을 모두 처리하고 종료
    {
        Fixture f;
        Channel<Decision> decisions(8);
        Channel<OrderResult> results(8);
        decisions.send(BuyDecision{"KRW-BTC", 50000.0, "surge"});
        decisions.send(HoldDecision{"x"});
        decisions.send(SellDecision{"KRW-BTC", 0.5, "take profit reached"});
        decisions.close();
        f.agent.run(decisions, results);
        assert(results.size() == 2);
        assert(results.tryReceive()->order.side == OrderSide::BID);
        assert(results.tryReceive()->order.side == OrderSide::ASK);
        assert(f.store->getAllActivePositions().empty());
    }

    // run: 결정이 없어도 주기적으로 미체결 주문을 정산해 결과 발행
    {
        ExecutionOptions options = defaultOptions();
        options.reconcile_interval = std::chrono::milliseconds(10);
        Fixture f(options);
        f.exchange->hold_fills = true;
        assert(!f.agent.execute(BuyDecision{"KRW-BTC", 50000.0, "surge"})->success);
        f.exchange->hold_fills = false;

        Channel<Decision> decisions(8);
        Channel<OrderResult> results(8);
        std::thread runner([&] { f.agent.run(decisions, results); });
        auto settled = results.receiveFor(std::chrono::seconds(5));
        decisions.close();
        runner.join();

        assert(settled.has_value());
        assert(settled->success);
        assert(settled->order.id == "buy-1");
        assert(f.store->getActivePosition("KRW-BTC").has_value());
    }

    std::cout << "[TEST] ExecutionAgent PASSED\n";
    return 0;
}
