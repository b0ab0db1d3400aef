#pragma once

#include "common/Channel.h"

#include <memory>
#include <mutex>
#include <vector>

namespace autocoin {

// 1:N 팬아웃. 구독자마다 독립된 bounded 채널을 가진다.
// send는 모든 구독자에게 복사본을 blocking으로 전달한다.
template<typename T>
class Broadcast : public ISender<T> {
public:
    explicit Broadcast(std::size_t capacity_per_subscriber)
        : capacity_(capacity_per_subscriber) {}

    std::shared_ptr<Channel<T>> subscribe() {
        std::lock_guard<std::mutex> lock(mutex_);
        auto channel = std::make_shared<Channel<T>>(capacity_);
        if (closed_) {
            channel->close();
        }
        subscribers_.push_back(channel);
        return channel;
    }

    // 하나 이상의 구독자에게 전달되면 true
    bool send(T value) override {
        auto targets = snapshot();
        bool delivered = false;
        for (auto& channel : targets) {
            delivered = channel->send(value) || delivered;
        }
        return delivered;
    }

    bool trySend(T value) override {
        auto targets = snapshot();
        bool delivered = false;
        for (auto& channel : targets) {
            delivered = channel->trySend(value) || delivered;
        }
        return delivered;
    }

    void close() {
        std::vector<std::shared_ptr<Channel<T>>> targets;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            closed_ = true;
            targets = subscribers_;
        }
        for (auto& channel : targets) {
            channel->close();
        }
    }

    std::size_t subscriberCount() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return subscribers_.size();
    }

private:
    std::vector<std::shared_ptr<Channel<T>>> snapshot() const {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) {
            return {};
        }
        return subscribers_;
    }

    const std::size_t capacity_;
    std::vector<std::shared_ptr<Channel<T>>> subscribers_;
    bool closed_ = false;
    mutable std::mutex mutex_;
};

} // namespace autocoin
