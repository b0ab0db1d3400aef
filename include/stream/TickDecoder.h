#pragma once

#include "common/Types.h"

#include <optional>
#include <string>
#include <vector>

namespace autocoin {
namespace stream {

// 업비트 웹소켓 프레임 -> Tick
class TickDecoder {
public:
    // '{' / '[' 로 시작하면 JSON, 0x00 으로 시작하면 나머지를 JSON으로 취급.
    // trade/ticker가 아닌 메시지(status 등)는 nullopt.
    // 해석 불가 프레임은 TradingError(MALFORMED_RESPONSE)
    static std::optional<Tick> decode(const std::string& frame);

    // {"ticket":"<uuid>","type":"trade","codes":["KRW-BTC",...]} (키 순서 고정)
    static std::string buildSubscription(const std::string& ticket,
                                         const std::string& type,
                                         const std::vector<std::string>& markets);
};

} // namespace stream
} // namespace autocoin
