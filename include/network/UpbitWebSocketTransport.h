#pragma once

#include "network/IStreamTransport.h"

#include <chrono>
#include <memory>
#include <mutex>
#include <string>

namespace autocoin {
namespace network {

struct WebSocketEndpoint {
    std::string host;
    std::string port;
    std::string target;
};

// "wss://host[:port]/path" 분해. 형식이 다르면 TradingError(INVALID_PARAMETER)
WebSocketEndpoint parseWebSocketUrl(const std::string& url);

struct WebSocketTimeouts {
    std::chrono::milliseconds connect{15000};   // resolve/TCP/TLS/WS 핸드셰이크 단계별
    std::chrono::milliseconds idle{90000};      // 수신 없이 이 시간이 지나면 TIMEOUT
};

// Boost.Beast SSL 웹소켓. ping/pong은 beast가 자동 처리.
// 모든 I/O는 비동기 작업 + 기한 있는 io_context 실행으로 처리해 half-open 연결에서도 반환한다.
class UpbitWebSocketTransport : public IStreamTransport {
public:
    explicit UpbitWebSocketTransport(WebSocketTimeouts timeouts = {});
    ~UpbitWebSocketTransport() override;

    void connect(const std::string& url) override;
    void send(const std::string& text) override;
    std::string read() override;
    void close() override;
    void interrupt() override;

private:
    struct Session;

    WebSocketTimeouts timeouts_;
    std::unique_ptr<Session> session_;
    std::mutex session_mutex_;
};

} // namespace network
} // namespace autocoin
