#pragma once

#include "common/Channel.h"
#include "common/Config.h"
#include "common/Types.h"

#include <deque>
#include <optional>

namespace autocoin {
namespace agents {

// 최근 tick 윈도우(전체 마켓 공용, FIFO)로 급등 + 거래량 급증을 감지
class SignalDetector {
public:
    explicit SignalDetector(const TradingConfig& config);

    // 급등 조건을 만족하면 Buy 신호, 아니면 nullopt
    std::optional<Signal> onTick(const Tick& tick);

    // in이 닫힐 때까지 처리. out이 닫히면 중단
    void run(Channel<Tick>& in, ISender<Signal>& out);

    std::size_t windowSize() const { return window_.size(); }

    static double confidence(double price_change, double surge_threshold,
                             double volume_ratio, double volume_multiplier);

private:
    double surge_threshold_;
    long long lookback_ms_;
    double volume_multiplier_;
    std::size_t capacity_;

    std::deque<Tick> window_;
};

} // namespace agents
} // namespace autocoin
