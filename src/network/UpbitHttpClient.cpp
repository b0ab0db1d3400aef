#include "network/UpbitHttpClient.h"
#include "network/JwtGenerator.h"
#include "common/Error.h"
#include "common/Logger.h"
#include <algorithm>
#include <set>
#include <cctype>

namespace autocoin {
namespace network {
namespace {
bool isSensitiveKey(const std::string& key) {
    static const std::set<std::string> kKeys = {
        "access_key", "secret_key", "authorization", "bearer",
        "jwt", "token", "api_key", "signature", "query_hash"
    };
    std::string lower = key;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return kKeys.find(lower) != kKeys.end();
}

void maskSensitiveJson(nlohmann::json& node) {
    if (node.is_object()) {
        for (auto it = node.begin(); it != node.end(); ++it) {
            if (isSensitiveKey(it.key())) {
                it.value() = "***";
            } else {
                maskSensitiveJson(it.value());
            }
        }
        return;
    }
    if (node.is_array()) {
        for (auto& item : node) {
            maskSensitiveJson(item);
        }
    }
}
}

std::string sanitizeForLog(const std::string& text) {
    auto j = nlohmann::json::parse(text, nullptr, false);
    if (j.is_discarded()) {
        return text;
    }
    maskSensitiveJson(j);
    return j.dump();
}

std::string rateLimitGroupFor(const std::string& endpoint) {
    if (endpoint.find("/v1/accounts") != std::string::npos) return "accounts";
    if (endpoint.find("/v1/order") != std::string::npos) return "order";
    return "default";
}

UpbitHttpClient::UpbitHttpClient(const std::string& access_key,
                                 const std::string& secret_key,
                                 const std::string& base_url,
                                 std::shared_ptr<execution::RateLimiter> rate_limiter)
    : access_key_(access_key)
    , secret_key_(secret_key)
    , base_url_(base_url)
    , rate_limiter_(std::move(rate_limiter))
{
    if (!rate_limiter_) {
        rate_limiter_ = std::make_shared<execution::RateLimiter>();
    }

    curl_global_init(CURL_GLOBAL_ALL);
    curl_ = curl_easy_init();

    if (!curl_) {
        throw TradingError(ErrorCode::NETWORK, "Failed to initialize CURL");
    }
}

UpbitHttpClient::~UpbitHttpClient() {
    if (curl_) {
        curl_easy_cleanup(curl_);
    }
    curl_global_cleanup();
}

HttpResponse UpbitHttpClient::get(
    const std::string& endpoint,
    const std::map<std::string, std::string>& query_params
) {
    rate_limiter_->acquire(rateLimitGroupFor(endpoint));

    std::string url = base_url_ + endpoint;
    if (!query_params.empty()) {
        url += "?" + JwtGenerator::buildQueryString(query_params);
    }

    std::map<std::string, std::string> headers;
    headers["Authorization"] = "Bearer " + JwtGenerator::generate(access_key_, secret_key_, query_params);
    headers["Content-Type"] = "application/json";

    auto response = performRequest("GET", url, "", headers);
    afterResponse(response);
    return response;
}

HttpResponse UpbitHttpClient::post(
    const std::string& endpoint,
    const nlohmann::json& body
) {
    rate_limiter_->acquire(rateLimitGroupFor(endpoint));

    // query_hash는 따옴표 없는 문자열 값으로 계산해야 서버와 일치
    std::map<std::string, std::string> query_params;
    for (auto& [key, value] : body.items()) {
        if (value.is_string()) {
            query_params[key] = value.get<std::string>();
        } else {
            query_params[key] = value.dump();
        }
    }

    std::map<std::string, std::string> headers;
    headers["Authorization"] = "Bearer " + JwtGenerator::generate(access_key_, secret_key_, query_params);
    headers["Content-Type"] = "application/json";

    auto response = performRequest("POST", base_url_ + endpoint, body.dump(), headers);
    afterResponse(response);
    return response;
}

void UpbitHttpClient::afterResponse(const HttpResponse& response) {
    auto it = response.headers.find("Remaining-Req");
    if (it == response.headers.end()) {
        it = response.headers.find("remaining-req");
    }
    if (it != response.headers.end()) {
        rate_limiter_->updateFromHeader(it->second);
    }

    if (response.isRateLimited() || response.isBlocked()) {
        rate_limiter_->handleRateLimitError(response.status_code);
    }
}

HttpResponse UpbitHttpClient::performRequest(
    const std::string& method,
    const std::string& url,
    const std::string& body_data,
    const std::map<std::string, std::string>& headers
) {
    std::lock_guard<std::mutex> lock(mutex_);

    HttpResponse response;
    std::string response_body;
    std::map<std::string, std::string> response_headers;

    curl_easy_reset(curl_);
    curl_easy_setopt(curl_, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl_, CURLOPT_WRITEFUNCTION, writeCallback);
    curl_easy_setopt(curl_, CURLOPT_WRITEDATA, &response_body);
    curl_easy_setopt(curl_, CURLOPT_HEADERFUNCTION, headerCallback);
    curl_easy_setopt(curl_, CURLOPT_HEADERDATA, &response_headers);
    curl_easy_setopt(curl_, CURLOPT_TIMEOUT, 30L);
    curl_easy_setopt(curl_, CURLOPT_CONNECTTIMEOUT, 10L);

    if (method == "POST") {
        curl_easy_setopt(curl_, CURLOPT_POST, 1L);
        curl_easy_setopt(curl_, CURLOPT_POSTFIELDS, body_data.c_str());
        curl_easy_setopt(curl_, CURLOPT_POSTFIELDSIZE, static_cast<long>(body_data.size()));
    }

    struct curl_slist* header_list = nullptr;
    for (const auto& [key, value] : headers) {
        std::string header_line = key + ": " + value;
        header_list = curl_slist_append(header_list, header_line.c_str());
    }
    curl_easy_setopt(curl_, CURLOPT_HTTPHEADER, header_list);

    CURLcode res = curl_easy_perform(curl_);
    curl_slist_free_all(header_list);

    if (res == CURLE_OPERATION_TIMEDOUT) {
        throw TradingError(ErrorCode::TIMEOUT, "CURL timeout: " + std::string(curl_easy_strerror(res)));
    }
    if (res != CURLE_OK) {
        throw TradingError(ErrorCode::NETWORK, "CURL error: " + std::string(curl_easy_strerror(res)));
    }

    long http_code = 0;
    curl_easy_getinfo(curl_, CURLINFO_RESPONSE_CODE, &http_code);

    response.status_code = static_cast<int>(http_code);
    response.body = std::move(response_body);
    response.headers = std::move(response_headers);

    LOG_DEBUG("{} {} -> {}", method, url.substr(0, url.find('?')), response.status_code);
    return response;
}

size_t UpbitHttpClient::writeCallback(void* contents, size_t size, size_t nmemb, void* userp) {
    size_t total_size = size * nmemb;
    auto* response_body = static_cast<std::string*>(userp);
    response_body->append(static_cast<char*>(contents), total_size);
    return total_size;
}

size_t UpbitHttpClient::headerCallback(char* buffer, size_t size, size_t nitems, void* userdata) {
    size_t total_size = size * nitems;
    std::string header_line(buffer, total_size);

    size_t colon_pos = header_line.find(':');
    if (colon_pos != std::string::npos) {
        std::string key = header_line.substr(0, colon_pos);
        std::string value = header_line.substr(colon_pos + 1);

        value.erase(0, value.find_first_not_of(" \t\r\n"));
        value.erase(value.find_last_not_of(" \t\r\n") + 1);

        auto* headers = static_cast<std::map<std::string, std::string>*>(userdata);
        (*headers)[key] = value;
    }

    return total_size;
}

} // namespace network
} // namespace autocoin
