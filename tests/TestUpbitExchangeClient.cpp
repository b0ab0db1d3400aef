#include "common/Error.h"
#include "exchange/UpbitExchangeClient.h"
#include "network/IHttpClient.h"
#include "TestFakes.h"

#include <cassert>
#include <deque>
#include <functional>
#include <iostream>
#include <map>
#include <memory>
#include <string>
#include <vector>

using namespace autocoin;
using autocoin::exchange::FillPollConfig;
using autocoin::exchange::UpbitExchangeClient;
using autocoin::network::HttpResponse;
using autocoin::testing::near;

namespace {
// 응답을 순서대로 돌려주고 요청을 기록하는 HTTP 클라이언트
class ScriptedHttpClient : public network::IHttpClient {
public:
    std::deque<HttpResponse> get_responses;
    std::deque<HttpResponse> post_responses;

    std::vector<std::string> get_endpoints;
    std::vector<std::map<std::string, std::string>> get_queries;
    std::vector<nlohmann::json> post_bodies;

    HttpResponse get(const std::string& endpoint,
                     const std::map<std::string, std::string>& query_params) override {
        get_endpoints.push_back(endpoint);
        get_queries.push_back(query_params);
        return next(get_responses);
    }

    HttpResponse post(const std::string& endpoint, const nlohmann::json& body) override {
        (void)endpoint;
        post_bodies.push_back(body);
        return next(post_responses);
    }

private:
    static HttpResponse next(std::deque<HttpResponse>& queue) {
        if (queue.empty()) {
            return HttpResponse{500, R"({"error":{"message":"unscripted"}})", {}};
        }
        HttpResponse r = queue.front();
        queue.pop_front();
        return r;
    }
};

HttpResponse ok(const std::string& body) {
    return HttpResponse{200, body, {}};
}

struct Fixture {
    std::shared_ptr<ScriptedHttpClient> http = std::make_shared<ScriptedHttpClient>();
    UpbitExchangeClient client{http, FillPollConfig{3, std::chrono::milliseconds(0)}};
};

bool throwsCode(const std::function<void()>& fn, ErrorCode code) {
    try {
        fn();
    } catch (const TradingError& e) {
        return e.code() == code;
    }
    return false;
}
}

int main() {
    // 시장가 매수: 접수(wait) -> 조회 1회 후 done, 체결 금액은 trades 합계
    {
        Fixture f;
        f.http->post_responses.push_back(ok(
            R"({"uuid":"u-1","side":"bid","ord_type":"price","price":"50000","state":"wait",)"
            R"("market":"KRW-BTC","volume":null,"executed_volume":"0","trades":[]})"));
        f.http->get_responses.push_back(ok(
            R"({"uuid":"u-1","side":"bid","ord_type":"price","price":"50000","state":"done",)"
            R"("market":"KRW-BTC","executed_volume":"0.5",)"
            R"("trades":[{"price":"100000","volume":"0.3","funds":"30000"},)"
            R"({"price":"100000","volume":"0.2","funds":"20000"}]})"));

        Order order = f.client.buyMarketOrder("KRW-BTC", 50000.0);
        assert(order.id == "u-1");
        assert(order.side == OrderSide::BID);
        assert(order.status == OrderStatus::EXECUTED);
        assert(near(order.executed_volume, 0.5));
        assert(near(order.executed_amount, 50000.0));

        assert(f.http->post_bodies.size() == 1);
        const auto& body = f.http->post_bodies.front();
        assert(body["market"] == "KRW-BTC");
        assert(body["side"] == "bid");
        assert(body["ord_type"] == "price");
        assert(body["price"] == "50000");
        assert(!body.contains("volume"));

        assert(f.http->get_endpoints.size() == 1);
        assert(f.http->get_endpoints.front() == "/v1/order");
        assert(f.http->get_queries.front().at("uuid") == "u-1");
    }

    // 시장가 매도: volume 문자열, 즉시 done이면 조회 없음
    {
        Fixture f;
        f.http->post_responses.push_back(ok(
            R"({"uuid":"u-2","side":"ask","ord_type":"market","state":"done","market":"KRW-BTC",)"
            R"("volume":"0.5","executed_volume":"0.5","trades":[{"price":"110000","volume":"0.5"}]})"));

        Order order = f.client.sellMarketOrder("KRW-BTC", 0.5);
        assert(order.side == OrderSide::ASK);
        assert(order.isExecuted());
        assert(near(order.executed_amount, 55000.0));

        const auto& body = f.http->post_bodies.front();
        assert(body["side"] == "ask");
        assert(body["ord_type"] == "market");
        assert(body["volume"] == "0.5");
        assert(!body.contains("price"));
        assert(f.http->get_endpoints.empty());
    }

    // 체결 조회가 실패하면 주문을 다시 내지 않고 WAITING으로 반환
    {
        Fixture f;
        f.http->post_responses.push_back(ok(
            R"({"uuid":"u-3","side":"bid","state":"wait","market":"KRW-BTC","executed_volume":"0"})"));
        f.http->get_responses.push_back(HttpResponse{500, "upstream error", {}});

        Order order = f.client.buyMarketOrder("KRW-BTC", 50000.0);
        assert(order.id == "u-3");
        assert(order.status == OrderStatus::WAITING);
        assert(near(order.executed_volume, 0.0));
        assert(f.http->post_bodies.size() == 1);
        assert(f.http->get_endpoints.size() == 1);
    }

    // 조회 횟수 소진: 마지막 상태 그대로
    {
        Fixture f;
        const std::string waiting =
            R"({"uuid":"u-4","side":"bid","state":"wait","market":"KRW-BTC","executed_volume":"0"})";
        f.http->post_responses.push_back(ok(waiting));
        for (int i = 0; i < 5; ++i) {
            f.http->get_responses.push_back(ok(waiting));
        }
        Order order = f.client.buyMarketOrder("KRW-BTC", 50000.0);
        assert(order.status == OrderStatus::WAITING);
        assert(f.http->get_endpoints.size() == 3);
    }

    // HTTP 상태 -> 오류 코드
    {
        Fixture f;
        f.http->post_responses.push_back(HttpResponse{429, R"({"error":{"name":"too_many_requests"}})", {}});
        f.http->post_responses.push_back(HttpResponse{401, R"({"error":{"name":"invalid_access_key"}})", {}});
        f.http->post_responses.push_back(HttpResponse{503, "", {}});
        assert(throwsCode([&] { f.client.buyMarketOrder("KRW-BTC", 50000.0); }, ErrorCode::RATE_LIMITED));
        assert(throwsCode([&] { f.client.buyMarketOrder("KRW-BTC", 50000.0); }, ErrorCode::INVALID_CREDENTIALS));
        assert(throwsCode([&] { f.client.sellMarketOrder("KRW-BTC", 0.5); }, ErrorCode::EXCHANGE_UNAVAILABLE));
    }

    // 잘못된 응답 본문
    {
        Fixture f;
        f.http->post_responses.push_back(ok("{not json"));
        f.http->post_responses.push_back(ok(R"({"state":"done"})"));
        f.http->post_responses.push_back(ok(R"({"uuid":7,"state":"done"})"));
        f.http->post_responses.push_back(ok(R"(["u-5"])"));
        assert(throwsCode([&] { f.client.buyMarketOrder("KRW-BTC", 50000.0); }, ErrorCode::MALFORMED_RESPONSE));
        assert(throwsCode([&] { f.client.buyMarketOrder("KRW-BTC", 50000.0); }, ErrorCode::MALFORMED_RESPONSE));
        assert(throwsCode([&] { f.client.buyMarketOrder("KRW-BTC", 50000.0); }, ErrorCode::MALFORMED_RESPONSE));
        assert(throwsCode([&] { f.client.buyMarketOrder("KRW-BTC", 50000.0); }, ErrorCode::MALFORMED_RESPONSE));
    }

    // 잘못된 주문 파라미터는 요청 전에 거부
    {
        Fixture f;
        assert(throwsCode([&] { f.client.buyMarketOrder("KRW-BTC", 0.0); }, ErrorCode::INVALID_PARAMETER));
        assert(throwsCode([&] { f.client.sellMarketOrder("KRW-BTC", -1.0); }, ErrorCode::INVALID_PARAMETER));
        assert(f.http->post_bodies.empty());
    }

    // 잔고: KRW 가용 = balance - locked
    {
        Fixture f;
        f.http->get_responses.push_back(ok(
            R"([{"currency":"KRW","balance":"100000.0","locked":"2000.0","avg_buy_price":"0"},)"
            R"({"currency":"BTC","balance":"0.5","locked":"0","avg_buy_price":"100000"}])"));
        assert(near(f.client.getBalance(), 98000.0));
        assert(f.http->get_endpoints.front() == "/v1/accounts");

        f.http->get_responses.push_back(ok(R"([{"currency":"BTC","balance":"0.5"}])"));
        assert(near(f.client.getBalance(), 0.0));

        f.http->get_responses.push_back(ok(R"({"currency":"KRW"})"));
        assert(throwsCode([&] { f.client.getBalances(); }, ErrorCode::MALFORMED_RESPONSE));

        f.http->get_responses.push_back(ok(R"([{"currency":1,"balance":"5"}])"));
        assert(throwsCode([&] { f.client.getBalances(); }, ErrorCode::MALFORMED_RESPONSE));
    }

    // 주문 조회
    {
        Fixture f;
        f.http->get_responses.push_back(ok(
            R"({"uuid":"u-6","side":"ask","state":"cancel","market":"KRW-BTC","volume":"1.0",)"
            R"("executed_volume":"0.4","executed_funds":"40000"})"));
        Order order = f.client.getOrder("u-6");
        assert(order.status == OrderStatus::EXECUTED);
        assert(near(order.executed_amount, 40000.0));
        assert(f.http->get_queries.front().at("uuid") == "u-6");
    }

    // 주문 파라미터 문자열
    assert(exchange::formatDecimal(50000.0, 0) == "50000");
    assert(exchange::formatDecimal(0.12345678, 8) == "0.12345678");
    assert(exchange::formatDecimal(0.5, 8) == "0.5");

    std::cout << "[TEST] UpbitExchangeClient PASSED\n";
    return 0;
}
