#include "notification/DiscordNotifier.h"
#include "notification/NotificationAgent.h"
#include "TestFakes.h"

#include <cassert>
#include <iostream>
#include <memory>

using namespace autocoin;
using autocoin::notification::DiscordNotifier;

namespace {
OrderResult buyResult() {
    Order o;
    o.id = "buy-1";
    o.market = "KRW-BTC";
    o.side = OrderSide::BID;
    o.status = OrderStatus::EXECUTED;
    o.executed_volume = 0.5;
    o.executed_amount = 50000.0;
    return OrderResult::succeeded(o);
}

OrderResult sellResult(std::optional<double> pnl) {
    Order o;
    o.id = "sell-1";
    o.market = "KRW-BTC";
    o.side = OrderSide::ASK;
    o.status = OrderStatus::EXECUTED;
    o.executed_volume = 0.5;
    o.executed_amount = 47000.0;
    auto r = OrderResult::succeeded(o);
    if (pnl) {
        r.realized_pnl = *pnl;
        r.realized_pnl_rate = *pnl / 50000.0;
    }
    return r;
}

const nlohmann::json& embedOf(const nlohmann::json& payload) {
    return payload["embeds"][0];
}
}

int main() {
    DiscordConfig config;
    config.enabled = true;
    config.webhook_url = "https://discord.test/hook";

    // 매수
    {
        auto payload = DiscordNotifier::buildOrderPayload(config, buyResult());
        assert(payload.has_value());
        const auto& embed = embedOf(*payload);
        assert(embed["title"] == "매수 체결 알림");
        assert(embed["color"] == notification::kColorBuy);
        assert(embed["fields"][0]["value"] == "KRW-BTC");
        assert(embed["fields"][1]["value"] == "100000.00 KRW");
        assert(embed.contains("timestamp"));
    }

    // 매도: 손익 부호로 제목 결정
    {
        auto loss = DiscordNotifier::buildOrderPayload(config, sellResult(-3000.0));
        assert(embedOf(*loss)["title"] == "손절 체결 알림");
        assert(embedOf(*loss)["color"] == notification::kColorSell);
        assert(embedOf(*loss)["fields"].size() == 5);

        auto gain = DiscordNotifier::buildOrderPayload(config, sellResult(2000.0));
        assert(embedOf(*gain)["title"] == "익절 체결 알림");

        auto unknown = DiscordNotifier::buildOrderPayload(config, sellResult(std::nullopt));
        assert(embedOf(*unknown)["title"] == "익절/손절 체결 알림");
        assert(embedOf(*unknown)["fields"].size() == 3);
    }

    // 실패
    {
        auto failed = OrderResult::failed("KRW-BTC", OrderSide::BID, "max retries exceeded: timeout");
        auto payload = DiscordNotifier::buildOrderPayload(config, failed);
        assert(embedOf(*payload)["title"] == "시스템 에러");
        assert(embedOf(*payload)["color"] == notification::kColorError);
        assert(embedOf(*payload)["description"] == "주문 실패: max retries exceeded: timeout");
    }

    // 이벤트별 필터
    {
        DiscordConfig filtered = config;
        filtered.notify_on_buy = false;
        filtered.notify_on_sell = false;
        filtered.notify_on_error = false;
        assert(!DiscordNotifier::buildOrderPayload(filtered, buyResult()));
        assert(!DiscordNotifier::buildOrderPayload(filtered, sellResult(1.0)));
        assert(!DiscordNotifier::buildOrderPayload(
            filtered, OrderResult::failed("KRW-BTC", OrderSide::ASK, "x")));
    }

    // 알림
    {
        auto payload = DiscordNotifier::buildAlertPayload("Market data stream", "max retries exceeded");
        assert(embedOf(payload)["title"] == "시스템 에러");
        assert(embedOf(payload)["description"] == "max retries exceeded");
        assert(embedOf(payload)["fields"][0]["value"] == "Market data stream");
    }

    // 깨진 UTF-8이 섞인 메시지도 직렬화 가능
    {
        const std::string broken = std::string("WS read failed: \xff\xfe") + " reset";
        auto payload = DiscordNotifier::buildAlertPayload("Market data stream", broken);

        bool strict_dump_threw = false;
        try {
            (void)payload.dump();
        } catch (const nlohmann::json::type_error&) {
            strict_dump_threw = true;
        }
        assert(strict_dump_threw);

        const std::string body = DiscordNotifier::serializePayload(payload);
        assert(body.find("WS read failed: ") != std::string::npos);
        assert(body.find("\xEF\xBF\xBD") != std::string::npos);
        assert(nlohmann::json::parse(body)["embeds"][0]["fields"][0]["value"] == "Market data stream");
    }

    // 전송 실패(접속 거부)와 깨진 메시지는 호출자에게 예외로 새지 않는다
    {
        DiscordConfig config;
        config.enabled = true;
        config.webhook_url = "http://127.0.0.1:1/webhook";
        DiscordNotifier notifier(config);
        notifier.notifyAlert("Market data stream", std::string("bad \xc3\x28 bytes"));
        notifier.notifyOrderResult(buyResult());
    }

    // 비활성화된 notifier는 아무것도 보내지 않는다
    {
        DiscordConfig disabled;
        DiscordNotifier notifier(disabled);
        notifier.notifyOrderResult(buyResult());
        notifier.notifyAlert("t", "m");
    }

    // NotificationAgent: 채널이 닫힐 때까지 전달
    {
        auto recorder = std::make_shared<testing::RecordingNotifier>();
        notification::NotificationAgent agent(recorder);
        Channel<OrderResult> in(4);
        in.send(buyResult());
        in.send(sellResult(1.0));
        in.close();
        agent.run(in);
        assert(agent.delivered() == 2);
        assert(recorder->resultCount() == 2);
    }

    std::cout << "[TEST] DiscordNotifier PASSED\n";
    return 0;
}
