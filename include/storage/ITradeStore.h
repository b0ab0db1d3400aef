#pragma once

#include "common/Types.h"

#include <optional>
#include <string>
#include <vector>

namespace autocoin {
namespace storage {

// 포지션/주문 영속화. 쓰기는 성공 여부를 bool로 보고한다.
class ITradeStore {
public:
    virtual ~ITradeStore() = default;

    // id 기준 upsert
    virtual bool savePosition(const Position& position) = 0;

    // 해당 마켓의 활성 포지션을 청산 상태로 기록
    virtual bool closePosition(const std::string& market, Price exit_price,
                               Amount pnl, double pnl_rate) = 0;

    virtual std::vector<Position> getAllActivePositions() = 0;
    virtual std::optional<Position> getActivePosition(const std::string& market) = 0;

    // id 기준 upsert
    virtual bool saveOrder(const Order& order) = 0;
    virtual std::vector<Order> getOrders() = 0;
};

} // namespace storage
} // namespace autocoin
