#pragma once

#include <chrono>
#include <stdexcept>
#include <string>

namespace autocoin {

enum class ErrorCode {
    RATE_LIMITED,           // 429
    IP_BLOCKED,             // 418
    NETWORK,                // 연결 실패/리셋
    TIMEOUT,
    EXCHANGE_UNAVAILABLE,   // 5xx
    CONNECTION_CLOSED,      // 스트림 피어 종료
    INVALID_CREDENTIALS,    // 401/403
    MALFORMED_RESPONSE,
    API_ERROR,              // 기타 4xx
    INVALID_PARAMETER,
    MAX_RETRIES_EXCEEDED,
    STORAGE,
    CONFIG
};

const char* toString(ErrorCode code);

class TradingError : public std::runtime_error {
public:
    TradingError(ErrorCode code, const std::string& message);

    ErrorCode code() const noexcept { return code_; }

    // 재시도 대상: rate limit, 네트워크/타임아웃, 거래소 일시 장애, 스트림 끊김
    bool isRetryable() const noexcept;

    // 인증/연결성 실패는 프로세스 레벨 알림 대상
    bool isAlertWorthy() const noexcept;

private:
    ErrorCode code_;
};

// HTTP 상태 코드 -> 에러 분류
ErrorCode classifyHttpStatus(int status_code);

} // namespace autocoin
