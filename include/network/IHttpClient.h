#pragma once

#include <string>
#include <map>
#include <nlohmann/json.hpp>

namespace autocoin {
namespace network {

struct HttpResponse {
    int status_code = 0;
    std::string body;
    std::map<std::string, std::string> headers;

    bool isSuccess() const { return status_code >= 200 && status_code < 300; }
    bool isRateLimited() const { return status_code == 429; }
    bool isBlocked() const { return status_code == 418; }

    // 파싱 실패 시 nlohmann::json::parse_error
    nlohmann::json json() const {
        return nlohmann::json::parse(body);
    }
};

class IHttpClient {
public:
    virtual ~IHttpClient() = default;

    virtual HttpResponse get(
        const std::string& endpoint,
        const std::map<std::string, std::string>& query_params = {}
    ) = 0;

    virtual HttpResponse post(
        const std::string& endpoint,
        const nlohmann::json& body
    ) = 0;
};

} // namespace network
} // namespace autocoin
