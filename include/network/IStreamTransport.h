#pragma once

#include <string>

namespace autocoin {
namespace network {

// 메시지 단위 스트림 전송 계층 (웹소켓). 실패는 TradingError로 던진다.
class IStreamTransport {
public:
    virtual ~IStreamTransport() = default;

    virtual void connect(const std::string& url) = 0;
    virtual void send(const std::string& text) = 0;

    // 다음 메시지 1건 (text/binary 모두 raw bytes). 피어 종료 시 CONNECTION_CLOSED
    virtual std::string read() = 0;

    virtual void close() = 0;

    // 다른 스레드에서 블로킹 read를 깨운다
    virtual void interrupt() = 0;
};

} // namespace network
} // namespace autocoin
