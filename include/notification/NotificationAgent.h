#pragma once

#include "common/Channel.h"
#include "notification/INotifier.h"

#include <memory>

namespace autocoin {
namespace notification {

// 알림 채널을 별도 스레드에서 소비
class NotificationAgent {
public:
    explicit NotificationAgent(std::shared_ptr<INotifier> notifier);

    void run(Channel<OrderResult>& in);

    std::size_t delivered() const { return delivered_; }

private:
    std::shared_ptr<INotifier> notifier_;
    std::size_t delivered_ = 0;
};

} // namespace notification
} // namespace autocoin
