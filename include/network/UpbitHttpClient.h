#pragma once

#include "network/IHttpClient.h"
#include "execution/RateLimiter.h"
#include <curl/curl.h>
#include <memory>
#include <mutex>

namespace autocoin {
namespace network {

// 업비트 REST (JWT 인증 + Rate Limit). 전송 실패는 TradingError(NETWORK/TIMEOUT)
class UpbitHttpClient : public IHttpClient {
public:
    UpbitHttpClient(const std::string& access_key,
                    const std::string& secret_key,
                    const std::string& base_url,
                    std::shared_ptr<execution::RateLimiter> rate_limiter);
    ~UpbitHttpClient();

    UpbitHttpClient(const UpbitHttpClient&) = delete;
    UpbitHttpClient& operator=(const UpbitHttpClient&) = delete;

    HttpResponse get(
        const std::string& endpoint,
        const std::map<std::string, std::string>& query_params = {}
    ) override;

    HttpResponse post(
        const std::string& endpoint,
        const nlohmann::json& body
    ) override;

private:
    std::string access_key_;
    std::string secret_key_;
    std::string base_url_;
    CURL* curl_;
    std::mutex mutex_;
    std::shared_ptr<execution::RateLimiter> rate_limiter_;

    void afterResponse(const HttpResponse& response);

    HttpResponse performRequest(
        const std::string& method,
        const std::string& url,
        const std::string& body_data,
        const std::map<std::string, std::string>& headers
    );

    static size_t writeCallback(void* contents, size_t size, size_t nmemb, void* userp);
    static size_t headerCallback(char* buffer, size_t size, size_t nitems, void* userdata);
};

// 응답 본문 로그용: access_key/secret/jwt 등 민감 키 마스킹
std::string sanitizeForLog(const std::string& text);

// 엔드포인트 -> Rate Limit 그룹
std::string rateLimitGroupFor(const std::string& endpoint);

} // namespace network
} // namespace autocoin
