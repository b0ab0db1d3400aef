#pragma once

#include "common/Types.h"

#include <string>
#include <vector>

namespace autocoin {
namespace exchange {

// 거래소 주문/잔고 API. 실패는 TradingError (isRetryable()로 재시도 여부 판단)
class IExchangeClient {
public:
    virtual ~IExchangeClient() = default;

    // 시장가 매수: 원화 금액 지정 (side=bid, ord_type=price)
    virtual Order buyMarketOrder(const std::string& market, Amount amount_quote) = 0;

    // 시장가 매도: 수량 지정 (side=ask, ord_type=market)
    virtual Order sellMarketOrder(const std::string& market, Volume volume) = 0;

    virtual Order getOrder(const std::string& order_id) = 0;

    // 주문 가능 KRW
    virtual Amount getBalance() = 0;

    virtual std::vector<Balance> getBalances() = 0;
};

} // namespace exchange
} // namespace autocoin
