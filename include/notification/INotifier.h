#pragma once

#include "common/Types.h"

#include <string>

namespace autocoin {
namespace notification {

// 알림 채널. 실패는 내부에서 로그만 남긴다 (fire-and-forget)
class INotifier {
public:
    virtual ~INotifier() = default;

    virtual void notifyOrderResult(const OrderResult& result) = 0;

    // 프로세스 레벨 경보 (스트림 치명 오류, 인증 실패 등)
    virtual void notifyAlert(const std::string& title, const std::string& message) = 0;
};

} // namespace notification
} // namespace autocoin
