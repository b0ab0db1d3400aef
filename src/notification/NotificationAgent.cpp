#include "notification/NotificationAgent.h"

#include "common/Logger.h"

namespace autocoin {
namespace notification {

NotificationAgent::NotificationAgent(std::shared_ptr<INotifier> notifier)
    : notifier_(std::move(notifier)) {}

void NotificationAgent::run(Channel<OrderResult>& in) {
    while (auto result = in.receive()) {
        if (!notifier_) {
            continue;
        }
        try {
            notifier_->notifyOrderResult(*result);
            ++delivered_;
        } catch (const std::exception& e) {
            LOG_WARN("[Notification] 알림 처리 실패: {}", e.what());
        }
    }
    LOG_INFO("[Notification] 종료 ({}건 전달)", delivered_);
}

} // namespace notification
} // namespace autocoin
