#include "agents/SignalDetector.h"

#include "common/Logger.h"

#include <algorithm>
#include <iomanip>
#include <sstream>

namespace autocoin {
namespace agents {

SignalDetector::SignalDetector(const TradingConfig& config)
    : surge_threshold_(config.surge_threshold)
    , lookback_ms_(static_cast<long long>(config.surge_timeframe_minutes) * 60LL * 1000LL)
    , volume_multiplier_(config.volume_multiplier)
    , capacity_(config.history_capacity == 0 ? 1 : config.history_capacity) {}

double SignalDetector::confidence(double price_change, double surge_threshold,
                                  double volume_ratio, double volume_multiplier) {
    const double price_score = std::min(2.0, price_change / surge_threshold) / 2.0;
    const double volume_score = std::min(3.0, volume_ratio / volume_multiplier) / 3.0;
    return std::min(1.0, 0.6 * price_score + 0.4 * volume_score);
}

std::optional<Signal> SignalDetector::onTick(const Tick& tick) {
    window_.push_back(tick);
    while (window_.size() > capacity_) {
        window_.pop_front();
    }

    // 기준 시각은 들어온 tick 자신의 timestamp
    const long long since = tick.timestamp - lookback_ms_;

    const Tick* oldest = nullptr;
    std::size_t count = 0;
    double volume_sum = 0.0;
    for (const auto& t : window_) {
        if (t.market != tick.market || t.timestamp < since) {
            continue;
        }
        if (!oldest) {
            oldest = &t;
        }
        ++count;
        volume_sum += t.volume;
    }

    if (count < 2 || oldest->trade_price <= 0.0) {
        return std::nullopt;
    }

    const double price_change = tick.trade_price / oldest->trade_price - 1.0;
    const double avg_volume = volume_sum / static_cast<double>(count);
    const double volume_ratio = (avg_volume > 0.0) ? tick.volume / avg_volume : 1.0;

    if (price_change < surge_threshold_ || volume_ratio < volume_multiplier_) {
        return std::nullopt;
    }

    std::ostringstream reason;
    reason << "Price surged " << std::fixed << std::setprecision(2) << price_change * 100.0
           << "% with " << std::setprecision(1) << volume_ratio << "x volume";

    auto signal = Signal::buy(tick.market,
                              confidence(price_change, surge_threshold_, volume_ratio, volume_multiplier_),
                              reason.str());
    signal.timestamp = tick.timestamp;
    return signal;
}

void SignalDetector::run(Channel<Tick>& in, ISender<Signal>& out) {
    LOG_INFO("[SignalDetector] 시작 (threshold={:.2f}%, lookback={}분, volume x{:.1f})",
             surge_threshold_ * 100.0, lookback_ms_ / 60000, volume_multiplier_);

    while (auto tick = in.receive()) {
        auto signal = onTick(*tick);
        if (!signal) {
            continue;
        }
        LOG_INFO("[SignalDetector] {} {} (confidence {:.2f}) - {}",
                 signal->market, toString(signal->kind), signal->confidence, signal->reason);
        if (!out.send(std::move(*signal))) {
            LOG_WARN("[SignalDetector] 신호 채널 닫힘 - 종료");
            return;
        }
    }
    LOG_INFO("[SignalDetector] 입력 종료 (window {}건)", window_.size());
}

} // namespace agents
} // namespace autocoin
