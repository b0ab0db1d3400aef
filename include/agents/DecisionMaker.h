#pragma once

#include "common/Channel.h"
#include "common/Config.h"
#include "common/Types.h"
#include "storage/ITradeStore.h"

#include <memory>
#include <mutex>

namespace autocoin {
namespace agents {

// 신호 + 잔고 + 포지션 -> Decision (신호 1건당 정확히 1건)
class DecisionMaker {
public:
    DecisionMaker(const TradingConfig& config, std::shared_ptr<storage::ITradeStore> store);

    Decision decide(const Signal& signal);

    void run(Channel<Signal>& in, ISender<Decision>& out);

    // 잔고 스냅샷 (체결 후 파이프라인이 갱신)
    void setBalance(Amount balance);
    Amount balance() const;

private:
    Decision decideBuy(const Signal& signal);
    Decision decideSell(const Signal& signal);

    double min_order_amount_;
    double max_position_ratio_;
    std::shared_ptr<storage::ITradeStore> store_;

    Amount balance_ = 0.0;
    mutable std::mutex balance_mutex_;
};

} // namespace agents
} // namespace autocoin
