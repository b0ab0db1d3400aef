#include "notification/DiscordNotifier.h"

#include "common/Logger.h"

#include <ctime>
#include <iomanip>
#include <sstream>

namespace autocoin {
namespace notification {

namespace {
std::string isoTimestampUtc() {
    std::time_t now = std::time(nullptr);
    std::tm tm{};
    gmtime_r(&now, &tm);
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
    return oss.str();
}

std::string formatNumber(double value, int precision) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(precision) << value;
    return oss.str();
}

nlohmann::json field(const std::string& name, const std::string& value, bool inline_field = true) {
    return {{"name", name}, {"value", value}, {"inline", inline_field}};
}

nlohmann::json wrapEmbed(nlohmann::json embed) {
    embed["timestamp"] = isoTimestampUtc();
    nlohmann::json payload;
    payload["embeds"] = nlohmann::json::array({embed});
    return payload;
}

size_t discardBody(void*, size_t size, size_t nmemb, void*) {
    return size * nmemb;
}
}

DiscordNotifier::DiscordNotifier(const DiscordConfig& config)
    : config_(config)
{
    if (!config_.enabled || config_.webhook_url.empty()) {
        LOG_INFO("[Discord] 알림 비활성화");
        return;
    }
    curl_global_init(CURL_GLOBAL_ALL);
    curl_ = curl_easy_init();
    if (!curl_) {
        LOG_ERROR("[Discord] CURL 초기화 실패 - 알림 비활성화");
    }
}

DiscordNotifier::~DiscordNotifier() {
    if (curl_) {
        curl_easy_cleanup(curl_);
        curl_global_cleanup();
    }
}

std::optional<nlohmann::json> DiscordNotifier::buildOrderPayload(const DiscordConfig& config,
                                                                 const OrderResult& result) {
    const Order& order = result.order;

    if (!result.success) {
        if (!config.notify_on_error) {
            return std::nullopt;
        }
        nlohmann::json embed;
        embed["title"] = "시스템 에러";
        embed["description"] = "주문 실패: " + result.error.value_or("unknown error");
        embed["color"] = kColorError;
        embed["fields"] = nlohmann::json::array({
            field("마켓", order.market),
            field("구분", order.side == OrderSide::BID ? "매수" : "매도")
        });
        return wrapEmbed(embed);
    }

    const Price avg_price = order.averageExecutedPrice();

    if (order.side == OrderSide::BID) {
        if (!config.notify_on_buy) {
            return std::nullopt;
        }
        nlohmann::json embed;
        embed["title"] = "매수 체결 알림";
        embed["color"] = kColorBuy;
        embed["fields"] = nlohmann::json::array({
            field("마켓", order.market),
            field("체결가", formatNumber(avg_price, 2) + " KRW"),
            field("수량", formatNumber(order.executed_volume, 8)),
            field("금액", formatNumber(order.executed_amount, 0) + " KRW")
        });
        return wrapEmbed(embed);
    }

    if (!config.notify_on_sell) {
        return std::nullopt;
    }

    std::string title = "익절/손절 체결 알림";
    if (result.realized_pnl) {
        title = (*result.realized_pnl >= 0.0) ? "익절 체결 알림" : "손절 체결 알림";
    }

    nlohmann::json embed;
    embed["title"] = title;
    embed["color"] = kColorSell;
    embed["fields"] = nlohmann::json::array({
        field("마켓", order.market),
        field("체결가", formatNumber(avg_price, 2) + " KRW"),
        field("수량", formatNumber(order.executed_volume, 8))
    });
    if (result.realized_pnl) {
        embed["fields"].push_back(field("손익", formatNumber(*result.realized_pnl, 0) + " KRW"));
    }
    if (result.realized_pnl_rate) {
        embed["fields"].push_back(field("수익률", formatNumber(*result.realized_pnl_rate * 100.0, 2) + "%"));
    }
    return wrapEmbed(embed);
}

nlohmann::json DiscordNotifier::buildAlertPayload(const std::string& title, const std::string& message) {
    nlohmann::json embed;
    embed["title"] = "시스템 에러";
    embed["description"] = message;
    embed["color"] = kColorError;
    embed["fields"] = nlohmann::json::array({field("유형", title, false)});
    return wrapEmbed(embed);
}

std::string DiscordNotifier::serializePayload(const nlohmann::json& payload) {
    // 거래소/예외 메시지에 섞인 깨진 UTF-8은 U+FFFD로 치환
    return payload.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

// 알림 실패는 로그만 남기고 호출자(파이프라인 스레드)로 전파하지 않는다
void DiscordNotifier::notifyOrderResult(const OrderResult& result) {
    if (!curl_) {
        return;
    }
    try {
        auto payload = buildOrderPayload(config_, result);
        if (payload) {
            post(*payload);
        }
    } catch (const std::exception& e) {
        LOG_ERROR("[Discord] 주문 알림 생성/전송 실패: {}", e.what());
    }
}

void DiscordNotifier::notifyAlert(const std::string& title, const std::string& message) {
    if (!curl_ || !config_.notify_on_error) {
        return;
    }
    try {
        post(buildAlertPayload(title, message));
    } catch (const std::exception& e) {
        LOG_ERROR("[Discord] 경보 알림 생성/전송 실패: {}", e.what());
    }
}

void DiscordNotifier::post(const nlohmann::json& payload) {
    std::lock_guard<std::mutex> lock(mutex_);

    const std::string body = serializePayload(payload);

    curl_easy_reset(curl_);
    curl_easy_setopt(curl_, CURLOPT_URL, config_.webhook_url.c_str());
    curl_easy_setopt(curl_, CURLOPT_POST, 1L);
    curl_easy_setopt(curl_, CURLOPT_POSTFIELDS, body.c_str());
    curl_easy_setopt(curl_, CURLOPT_POSTFIELDSIZE, static_cast<long>(body.size()));
    curl_easy_setopt(curl_, CURLOPT_WRITEFUNCTION, discardBody);
    curl_easy_setopt(curl_, CURLOPT_TIMEOUT, 10L);

    struct curl_slist* headers = nullptr;
    headers = curl_slist_append(headers, "Content-Type: application/json");
    curl_easy_setopt(curl_, CURLOPT_HTTPHEADER, headers);

    CURLcode res = curl_easy_perform(curl_);
    curl_slist_free_all(headers);

    if (res != CURLE_OK) {
        LOG_WARN("[Discord] 전송 실패: {}", curl_easy_strerror(res));
        return;
    }

    long http_code = 0;
    curl_easy_getinfo(curl_, CURLINFO_RESPONSE_CODE, &http_code);
    if (http_code < 200 || http_code >= 300) {
        LOG_WARN("[Discord] 전송 실패: HTTP {}", http_code);
    }
}

} // namespace notification
} // namespace autocoin
