#include "exchange/UpbitExchangeClient.h"

#include "common/Error.h"
#include "common/Logger.h"
#include "execution/OrderStateMapper.h"
#include "network/UpbitHttpClient.h"

#include <iomanip>
#include <sstream>
#include <thread>

namespace autocoin {
namespace exchange {

namespace {
double readNumber(const nlohmann::json& j, const char* key) {
    if (!j.contains(key) || j[key].is_null()) {
        return 0.0;
    }
    const auto& v = j[key];
    if (v.is_number()) {
        return v.get<double>();
    }
    if (v.is_string()) {
        try {
            return std::stod(v.get<std::string>());
        } catch (const std::exception&) {
            return 0.0;
        }
    }
    return 0.0;
}

// 필드 타입이 어긋난 응답도 MALFORMED_RESPONSE로 통일
Order toOrder(const nlohmann::json& j, const std::string& context) {
    if (!j.is_object()) {
        throw TradingError(ErrorCode::MALFORMED_RESPONSE, context + ": order response is not an object");
    }
    try {
        return execution::OrderStateMapper::fromJson(j);
    } catch (const nlohmann::json::exception& e) {
        throw TradingError(ErrorCode::MALFORMED_RESPONSE, context + ": invalid order field: " + e.what());
    }
}

bool isTerminal(const Order& order) {
    return order.status != OrderStatus::WAITING;
}
}

std::string formatDecimal(double value, int precision) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(precision) << value;
    std::string s = oss.str();
    if (s.find('.') != std::string::npos) {
        s.erase(s.find_last_not_of('0') + 1);
        if (!s.empty() && s.back() == '.') {
            s.pop_back();
        }
    }
    return s;
}

UpbitExchangeClient::UpbitExchangeClient(std::shared_ptr<network::IHttpClient> http, FillPollConfig fill_poll)
    : http_(std::move(http))
    , fill_poll_(fill_poll) {}

Order UpbitExchangeClient::buyMarketOrder(const std::string& market, Amount amount_quote) {
    if (amount_quote <= 0.0) {
        throw TradingError(ErrorCode::INVALID_PARAMETER, "buy amount must be positive");
    }

    nlohmann::json body;
    body["market"] = market;
    body["side"] = "bid";
    body["ord_type"] = "price";
    body["price"] = formatDecimal(amount_quote, 0);

    LOG_INFO("시장가 매수 요청: {} {} KRW", market, body["price"].get<std::string>());
    return waitForFill(placeOrder(body));
}

Order UpbitExchangeClient::sellMarketOrder(const std::string& market, Volume volume) {
    if (volume <= 0.0) {
        throw TradingError(ErrorCode::INVALID_PARAMETER, "sell volume must be positive");
    }

    nlohmann::json body;
    body["market"] = market;
    body["side"] = "ask";
    body["ord_type"] = "market";
    body["volume"] = formatDecimal(volume, 8);

    LOG_INFO("시장가 매도 요청: {} {}", market, body["volume"].get<std::string>());
    return waitForFill(placeOrder(body));
}

Order UpbitExchangeClient::getOrder(const std::string& order_id) {
    auto response = http_->get("/v1/order", {{"uuid", order_id}});
    auto j = parseOrThrow(response, "get order " + order_id);
    return toOrder(j, "get order " + order_id);
}

Amount UpbitExchangeClient::getBalance() {
    for (const auto& b : getBalances()) {
        if (b.currency == "KRW") {
            return b.available();
        }
    }
    return 0.0;
}

std::vector<Balance> UpbitExchangeClient::getBalances() {
    auto response = http_->get("/v1/accounts");
    auto j = parseOrThrow(response, "get accounts");
    if (!j.is_array()) {
        throw TradingError(ErrorCode::MALFORMED_RESPONSE, "accounts response is not an array");
    }

    std::vector<Balance> balances;
    balances.reserve(j.size());
    for (const auto& item : j) {
        const auto currency = item.is_object() ? item.find("currency") : item.end();
        if (currency == item.end() || !currency->is_string()) {
            throw TradingError(ErrorCode::MALFORMED_RESPONSE, "account entry has no currency");
        }
        Balance b;
        b.currency = currency->get<std::string>();
        b.balance = readNumber(item, "balance");
        b.locked = readNumber(item, "locked");
        b.avg_buy_price = readNumber(item, "avg_buy_price");
        balances.push_back(std::move(b));
    }
    return balances;
}

Order UpbitExchangeClient::placeOrder(const nlohmann::json& body) {
    auto response = http_->post("/v1/orders", body);
    auto j = parseOrThrow(response, "place order");
    auto order = toOrder(j, "place order");
    if (order.id.empty()) {
        throw TradingError(ErrorCode::MALFORMED_RESPONSE, "order response has no uuid");
    }
    return order;
}

Order UpbitExchangeClient::waitForFill(Order order) {
    for (int i = 0; i < fill_poll_.attempts && !isTerminal(order); ++i) {
        std::this_thread::sleep_for(fill_poll_.interval);
        try {
            order = getOrder(order.id);
        } catch (const TradingError& e) {
            // 주문은 이미 접수됨. 조회 실패로 주문 자체를 재시도하면 중복 체결
            LOG_WARN("체결 조회 실패 ({}): {}", order.id, e.what());
            break;
        }
    }

    if (order.isWaiting()) {
        LOG_WARN("주문 {} 체결 대기 상태로 반환 (executed_volume={})", order.id, order.executed_volume);
    }
    return order;
}

nlohmann::json UpbitExchangeClient::parseOrThrow(const network::HttpResponse& response,
                                                 const std::string& context) {
    if (!response.isSuccess()) {
        const std::string safe_body = network::sanitizeForLog(response.body);
        const ErrorCode code = classifyHttpStatus(response.status_code);
        LOG_ERROR("{} 실패: HTTP {} {}", context, response.status_code, safe_body);
        throw TradingError(code, context + " failed: HTTP " + std::to_string(response.status_code) +
                                 " " + safe_body);
    }

    auto j = nlohmann::json::parse(response.body, nullptr, false);
    if (j.is_discarded()) {
        throw TradingError(ErrorCode::MALFORMED_RESPONSE, context + ": invalid JSON body");
    }
    return j;
}

} // namespace exchange
} // namespace autocoin
