#include "common/Error.h"
#include "network/UpbitWebSocketTransport.h"

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>

#include <cassert>
#include <chrono>
#include <iostream>
#include <string>

using namespace autocoin;
using autocoin::network::parseWebSocketUrl;
using autocoin::network::UpbitWebSocketTransport;
using autocoin::network::WebSocketTimeouts;

namespace {
bool throwsCode(const std::string& url, ErrorCode code) {
    try {
        parseWebSocketUrl(url);
    } catch (const TradingError& e) {
        return e.code() == code;
    }
    return false;
}
}

int main() {
    // URL 분해
    {
        auto ep = parseWebSocketUrl("wss://api.upbit.com/websocket/v1");
        assert(ep.host == "api.upbit.com");
        assert(ep.port == "443");
        assert(ep.target == "/websocket/v1");

        auto local = parseWebSocketUrl("wss://127.0.0.1:9443");
        assert(local.host == "127.0.0.1");
        assert(local.port == "9443");
        assert(local.target == "/");

        assert(throwsCode("ws://api.upbit.com/websocket/v1", ErrorCode::INVALID_PARAMETER));
        assert(throwsCode("wss:///websocket/v1", ErrorCode::INVALID_PARAMETER));
        assert(throwsCode("wss://host:/path", ErrorCode::INVALID_PARAMETER));
    }

    // TCP는 붙지만 TLS 응답이 없는 서버: 기한 안에 TIMEOUT으로 반환
    {
        boost::asio::io_context ioc;
        boost::asio::ip::tcp::acceptor acceptor(
            ioc, {boost::asio::ip::make_address("127.0.0.1"), 0});
        const auto port = acceptor.local_endpoint().port();

        WebSocketTimeouts timeouts;
        timeouts.connect = std::chrono::milliseconds(300);
        timeouts.idle = std::chrono::milliseconds(300);
        UpbitWebSocketTransport transport(timeouts);

        const auto started = std::chrono::steady_clock::now();
        bool timed_out = false;
        try {
            transport.connect("wss://127.0.0.1:" + std::to_string(port) + "/websocket/v1");
        } catch (const TradingError& e) {
            timed_out = (e.code() == ErrorCode::TIMEOUT);
            assert(e.isRetryable());
        }
        const auto elapsed = std::chrono::steady_clock::now() - started;
        assert(timed_out);
        assert(elapsed < std::chrono::seconds(5));

        // 끊긴 세션 정리와 중복 close
        transport.close();
        transport.close();
        transport.interrupt();
    }

    // 연결 전 read/send
    {
        UpbitWebSocketTransport transport;
        bool closed = false;
        try {
            transport.read();
        } catch (const TradingError& e) {
            closed = (e.code() == ErrorCode::CONNECTION_CLOSED);
        }
        assert(closed);
    }

    std::cout << "[TEST] WebSocketTransport PASSED\n";
    return 0;
}
