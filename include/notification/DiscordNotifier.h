#pragma once

#include "common/Config.h"
#include "notification/INotifier.h"

#include <curl/curl.h>
#include <mutex>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>

namespace autocoin {
namespace notification {

constexpr int kColorBuy = 3066993;
constexpr int kColorSell = 15158332;
constexpr int kColorError = 15105570;

// Discord 웹훅 embed 알림
class DiscordNotifier : public INotifier {
public:
    explicit DiscordNotifier(const DiscordConfig& config);
    ~DiscordNotifier();

    DiscordNotifier(const DiscordNotifier&) = delete;
    DiscordNotifier& operator=(const DiscordNotifier&) = delete;

    void notifyOrderResult(const OrderResult& result) override;
    void notifyAlert(const std::string& title, const std::string& message) override;

    // 설정상 보내지 않는 이벤트면 nullopt
    static std::optional<nlohmann::json> buildOrderPayload(const DiscordConfig& config,
                                                           const OrderResult& result);
    static nlohmann::json buildAlertPayload(const std::string& title, const std::string& message);

    // 전송 본문. 잘못된 UTF-8도 예외 없이 직렬화
    static std::string serializePayload(const nlohmann::json& payload);

private:
    void post(const nlohmann::json& payload);

    DiscordConfig config_;
    CURL* curl_ = nullptr;
    std::mutex mutex_;
};

} // namespace notification
} // namespace autocoin
