#pragma once

#include "common/Types.h"
#include <string>
#include <nlohmann/json.hpp>

namespace autocoin {
namespace execution {

struct ExchangeOrderStateResult {
    OrderStatus status = OrderStatus::WAITING;
    bool terminal = false;
};

// 업비트 주문 응답(state 문자열, JSON) -> 내부 Order
class OrderStateMapper {
public:
    // wait/watch -> WAITING, done -> EXECUTED,
    // cancel -> 체결 수량이 있으면 EXECUTED (시장가 매수 잔량 취소), 없으면 CANCELED
    // 그 외 -> FAILED
    static ExchangeOrderStateResult map(const std::string& exchange_state, double executed_volume);

    // POST /v1/orders, GET /v1/order 응답 변환. 숫자 필드는 문자열/숫자 모두 허용
    static Order fromJson(const nlohmann::json& j);

    // "2024-01-02T03:04:05+09:00" -> epoch ms (실패 시 0)
    static long long parseTimestampMs(const std::string& iso8601);
};

} // namespace execution
} // namespace autocoin
