#pragma once

#include "common/Channel.h"
#include "common/Types.h"
#include "storage/ITradeStore.h"

#include <chrono>
#include <memory>
#include <optional>
#include <string>

namespace autocoin {
namespace agents {

struct RiskOptions {
    // 0이면 tick마다 저장소 재조회
    std::chrono::milliseconds position_refresh{1000};
    // 같은 포지션에 대한 청산 결정 재발행 최소 간격
    std::chrono::milliseconds exit_retry{30000};
};

// 보유 포지션 감시: 손절/익절 도달 시 Sell 결정
class RiskManager {
public:
    RiskManager(std::shared_ptr<storage::ITradeStore> store, RiskOptions options);

    // price <= stop_loss -> "stop loss triggered", price >= take_profit -> "take profit reached"
    static std::optional<Decision> evaluate(const Position& position, Price price);

    // 활성 포지션 로드 (2개 이상이면 첫 번째 선택 + 이상 로그)
    void start();

    std::optional<Decision> onTick(const Tick& tick);

    void run(Channel<Tick>& in, ISender<Decision>& out);

    std::optional<Position> currentPosition() const { return position_; }

private:
    using Clock = std::chrono::steady_clock;

    void refreshPosition();
    static std::string positionKey(const Position& position);

    std::shared_ptr<storage::ITradeStore> store_;
    RiskOptions options_;

    std::optional<Position> position_;
    Clock::time_point last_refresh_{};
    bool loaded_ = false;

    std::string last_exit_key_;
    Clock::time_point last_exit_time_{};
};

} // namespace agents
} // namespace autocoin
