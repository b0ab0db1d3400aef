#include "common/Error.h"

namespace autocoin {

const char* toString(ErrorCode code) {
    switch (code) {
        case ErrorCode::RATE_LIMITED: return "RATE_LIMITED";
        case ErrorCode::IP_BLOCKED: return "IP_BLOCKED";
        case ErrorCode::NETWORK: return "NETWORK";
        case ErrorCode::TIMEOUT: return "TIMEOUT";
        case ErrorCode::EXCHANGE_UNAVAILABLE: return "EXCHANGE_UNAVAILABLE";
        case ErrorCode::CONNECTION_CLOSED: return "CONNECTION_CLOSED";
        case ErrorCode::INVALID_CREDENTIALS: return "INVALID_CREDENTIALS";
        case ErrorCode::MALFORMED_RESPONSE: return "MALFORMED_RESPONSE";
        case ErrorCode::API_ERROR: return "API_ERROR";
        case ErrorCode::INVALID_PARAMETER: return "INVALID_PARAMETER";
        case ErrorCode::MAX_RETRIES_EXCEEDED: return "MAX_RETRIES_EXCEEDED";
        case ErrorCode::STORAGE: return "STORAGE";
        case ErrorCode::CONFIG: return "CONFIG";
    }
    return "API_ERROR";
}

TradingError::TradingError(ErrorCode code, const std::string& message)
    : std::runtime_error(message)
    , code_(code) {}

bool TradingError::isRetryable() const noexcept {
    switch (code_) {
        case ErrorCode::RATE_LIMITED:
        case ErrorCode::IP_BLOCKED:
        case ErrorCode::NETWORK:
        case ErrorCode::TIMEOUT:
        case ErrorCode::EXCHANGE_UNAVAILABLE:
        case ErrorCode::CONNECTION_CLOSED:
            return true;
        default:
            return false;
    }
}

bool TradingError::isAlertWorthy() const noexcept {
    return code_ == ErrorCode::INVALID_CREDENTIALS ||
           code_ == ErrorCode::IP_BLOCKED ||
           code_ == ErrorCode::MAX_RETRIES_EXCEEDED;
}

ErrorCode classifyHttpStatus(int status_code) {
    if (status_code == 429) return ErrorCode::RATE_LIMITED;
    if (status_code == 418) return ErrorCode::IP_BLOCKED;
    if (status_code == 401 || status_code == 403) return ErrorCode::INVALID_CREDENTIALS;
    if (status_code >= 500) return ErrorCode::EXCHANGE_UNAVAILABLE;
    return ErrorCode::API_ERROR;
}

} // namespace autocoin
