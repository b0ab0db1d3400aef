#pragma once

#include "exchange/IExchangeClient.h"
#include "network/IHttpClient.h"

#include <chrono>
#include <memory>

namespace autocoin {
namespace exchange {

struct FillPollConfig {
    int attempts = 10;
    std::chrono::milliseconds interval{200};
};

class UpbitExchangeClient : public IExchangeClient {
public:
    UpbitExchangeClient(std::shared_ptr<network::IHttpClient> http, FillPollConfig fill_poll);

    Order buyMarketOrder(const std::string& market, Amount amount_quote) override;
    Order sellMarketOrder(const std::string& market, Volume volume) override;
    Order getOrder(const std::string& order_id) override;
    Amount getBalance() override;
    std::vector<Balance> getBalances() override;

private:
    Order placeOrder(const nlohmann::json& body);

    // 시장가 주문 직후 체결 수량을 알기 위해 종결 상태까지 getOrder 폴링
    Order waitForFill(Order order);

    // 2xx가 아니면 상태 코드별 TradingError. 본문은 JSON으로 파싱해 반환
    nlohmann::json parseOrThrow(const network::HttpResponse& response, const std::string& context);

    std::shared_ptr<network::IHttpClient> http_;
    FillPollConfig fill_poll_;
};

// 주문 수량/금액 문자열 (업비트는 문자열 파라미터 사용)
std::string formatDecimal(double value, int precision);

} // namespace exchange
} // namespace autocoin
