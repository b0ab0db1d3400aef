#include "network/UpbitWebSocketTransport.h"

#include "common/Error.h"
#include "common/Logger.h"

#include <boost/asio/connect.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/ssl/host_name_verification.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/core/buffers_to_string.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/websocket.hpp>
#include <boost/beast/websocket/ssl.hpp>
#include <openssl/ssl.h>

namespace autocoin {
namespace network {

namespace beast = boost::beast;
namespace websocket = beast::websocket;
namespace net = boost::asio;
namespace ssl = boost::asio::ssl;
using tcp = boost::asio::ip::tcp;

struct UpbitWebSocketTransport::Session {
    net::io_context ioc;
    ssl::context ssl_ctx{ssl::context::tlsv12_client};
    websocket::stream<beast::ssl_stream<tcp::socket>> ws{ioc, ssl_ctx};
    beast::flat_buffer buffer;
    bool broken = false;    // 타임아웃/중단 후에는 close 핸드셰이크 생략

    Session() {
        ssl_ctx.set_default_verify_paths();
        ssl_ctx.set_verify_mode(ssl::verify_peer);
    }

    tcp::socket& socket() { return ws.next_layer().next_layer(); }

    // done이 될 때까지 핸들러를 하나씩 실행. beast의 ping 타이머가 작업을 계속 걸어두므로
    // run_for가 아닌 run_one_until로 완료 여부를 직접 확인한다.
    // 기한을 넘기면 소켓을 닫아 대기 중 작업을 취소시키고 TIMEOUT
    void runUntil(const bool& done, std::chrono::milliseconds timeout, const char* what) {
        const auto deadline = std::chrono::steady_clock::now() + timeout;
        if (ioc.stopped()) {
            ioc.restart();
        }
        while (!done) {
            if (ioc.run_one_until(deadline) == 0) {
                break;
            }
        }
        if (done) {
            return;
        }

        broken = true;
        boost::system::error_code ignored;
        socket().close(ignored);
        // 취소된 핸들러가 호출자 스택의 상태를 건드리기 전에 정리
        ioc.restart();
        while (!done && ioc.run_one_for(std::chrono::milliseconds(500)) > 0) {
        }
        throw TradingError(ErrorCode::TIMEOUT, std::string(what) + " timed out");
    }
};

WebSocketEndpoint parseWebSocketUrl(const std::string& url) {
    const std::string scheme = "wss://";
    if (url.compare(0, scheme.size(), scheme) != 0) {
        throw TradingError(ErrorCode::INVALID_PARAMETER, "unsupported websocket url: " + url);
    }

    std::string rest = url.substr(scheme.size());
    WebSocketEndpoint ep;

    auto slash = rest.find('/');
    std::string authority = (slash == std::string::npos) ? rest : rest.substr(0, slash);
    ep.target = (slash == std::string::npos) ? "/" : rest.substr(slash);

    auto colon = authority.find(':');
    if (colon == std::string::npos) {
        ep.host = authority;
        ep.port = "443";
    } else {
        ep.host = authority.substr(0, colon);
        ep.port = authority.substr(colon + 1);
    }

    if (ep.host.empty() || ep.port.empty()) {
        throw TradingError(ErrorCode::INVALID_PARAMETER, "invalid websocket url: " + url);
    }
    return ep;
}

UpbitWebSocketTransport::UpbitWebSocketTransport(WebSocketTimeouts timeouts)
    : timeouts_(timeouts) {}

UpbitWebSocketTransport::~UpbitWebSocketTransport() {
    close();
}

void UpbitWebSocketTransport::connect(const std::string& url) {
    const auto ep = parseWebSocketUrl(url);

    // interrupt()가 연결 중에도 소켓을 닫을 수 있도록 먼저 등록
    close();
    Session* s = nullptr;
    {
        std::lock_guard<std::mutex> lock(session_mutex_);
        session_ = std::make_unique<Session>();
        s = session_.get();
    }

    boost::system::error_code ec;
    bool done = false;
    auto fail = [&](const char* step) {
        if (ec == beast::error::timeout) {
            throw TradingError(ErrorCode::TIMEOUT, std::string("WS ") + step + " timed out");
        }
        throw TradingError(ErrorCode::NETWORK, std::string("WS ") + step + " failed: " + ec.message());
    };

    tcp::resolver resolver(s->ioc);
    tcp::resolver::results_type endpoints;
    resolver.async_resolve(ep.host, ep.port,
        [&](const boost::system::error_code& e, tcp::resolver::results_type results) {
            ec = e;
            endpoints = std::move(results);
            done = true;
        });
    s->runUntil(done, timeouts_.connect, "WS resolve");
    if (ec) fail("resolve");

    done = false;
    net::async_connect(s->socket(), endpoints,
        [&](const boost::system::error_code& e, const tcp::endpoint&) {
            ec = e;
            done = true;
        });
    s->runUntil(done, timeouts_.connect, "WS connect");
    if (ec) fail("connect");

    if (!SSL_set_tlsext_host_name(s->ws.next_layer().native_handle(), ep.host.c_str())) {
        throw TradingError(ErrorCode::NETWORK, "WS SNI setup failed");
    }
    s->ws.next_layer().set_verify_callback(ssl::host_name_verification(ep.host));

    done = false;
    s->ws.next_layer().async_handshake(ssl::stream_base::client,
        [&](const boost::system::error_code& e) {
            ec = e;
            done = true;
        });
    s->runUntil(done, timeouts_.connect, "TLS handshake");
    if (ec) fail("TLS handshake");

    s->ws.set_option(websocket::stream_base::timeout{
        timeouts_.connect,   // handshake timeout
        timeouts_.idle,      // idle timeout
        true                 // send ping automatically
    });
    s->ws.set_option(websocket::stream_base::decorator(
        [](websocket::request_type& req) {
            req.set(boost::beast::http::field::user_agent, "AutoCoin/1.0");
        }
    ));

    done = false;
    s->ws.async_handshake(ep.host, ep.target,
        [&](const boost::system::error_code& e) {
            ec = e;
            done = true;
        });
    s->runUntil(done, timeouts_.connect, "WS handshake");
    if (ec) fail("handshake");

    LOG_INFO("WS connected: {}{}", ep.host, ep.target);
}

void UpbitWebSocketTransport::send(const std::string& text) {
    if (!session_) {
        throw TradingError(ErrorCode::CONNECTION_CLOSED, "WS not connected");
    }

    boost::system::error_code ec;
    bool done = false;
    session_->ws.text(true);
    session_->ws.async_write(net::buffer(text),
        [&](const boost::system::error_code& e, std::size_t) {
            ec = e;
            done = true;
        });
    session_->runUntil(done, timeouts_.connect, "WS write");
    if (ec) {
        throw TradingError(ErrorCode::NETWORK, "WS write failed: " + ec.message());
    }
}

std::string UpbitWebSocketTransport::read() {
    if (!session_) {
        throw TradingError(ErrorCode::CONNECTION_CLOSED, "WS not connected");
    }

    boost::system::error_code ec;
    bool done = false;
    session_->ws.async_read(session_->buffer,
        [&](const boost::system::error_code& e, std::size_t) {
            ec = e;
            done = true;
        });
    // beast 자체 idle 타임아웃(ping 응답 없음)이 먼저 걸리고, 여유분은 최종 안전장치
    session_->runUntil(done, timeouts_.idle + timeouts_.connect, "WS read");

    if (!ec) {
        std::string payload = beast::buffers_to_string(session_->buffer.cdata());
        session_->buffer.consume(session_->buffer.size());
        return payload;
    }

    session_->broken = true;
    if (ec == beast::error::timeout) {
        throw TradingError(ErrorCode::TIMEOUT, "WS timed out");
    }
    if (ec == websocket::error::closed) {
        throw TradingError(ErrorCode::CONNECTION_CLOSED, "WS closed by server");
    }
    throw TradingError(ErrorCode::NETWORK, "WS read failed: " + ec.message());
}

void UpbitWebSocketTransport::close() {
    std::unique_ptr<Session> session;
    {
        std::lock_guard<std::mutex> lock(session_mutex_);
        session = std::move(session_);
    }
    if (!session) {
        return;
    }

    boost::system::error_code ec;
    if (session->broken || !session->ws.is_open()) {
        session->socket().close(ec);
        return;
    }

    bool done = false;
    session->ws.async_close(websocket::close_code::normal,
        [&](const boost::system::error_code& e) {
            ec = e;
            done = true;
        });
    try {
        session->runUntil(done, timeouts_.connect, "WS close");
    } catch (const TradingError& e) {
        LOG_WARN("WS close warning: {}", e.what());
        return;
    }
    if (ec && ec != websocket::error::closed && ec != net::error::not_connected) {
        LOG_WARN("WS close warning: {}", ec.message());
    }
}

void UpbitWebSocketTransport::interrupt() {
    std::lock_guard<std::mutex> lock(session_mutex_);
    if (!session_) {
        return;
    }
    // 소켓은 io_context 스레드(=read 호출 스레드)에서만 만진다
    Session* s = session_.get();
    net::post(s->ioc, [s] {
        s->broken = true;
        boost::system::error_code ec;
        s->socket().shutdown(tcp::socket::shutdown_both, ec);
        s->socket().close(ec);
    });
}

} // namespace network
} // namespace autocoin
