#include "common/Broadcast.h"
#include "common/Channel.h"

#include <cassert>
#include <iostream>
#include <thread>
#include <vector>

using autocoin::Broadcast;
using autocoin::Channel;

int main() {
    // FIFO + close 후 잔여 소비
    {
        Channel<int> ch(4);
        assert(ch.send(1));
        assert(ch.send(2));
        assert(ch.trySend(3));
        ch.close();
        assert(!ch.send(4));
        assert(*ch.receive() == 1);
        assert(*ch.receive() == 2);
        assert(*ch.receive() == 3);
        assert(!ch.receive().has_value());
    }

    // 용량 초과 시 trySend 실패
    {
        Channel<int> ch(2);
        assert(ch.trySend(1));
        assert(ch.trySend(2));
        assert(!ch.trySend(3));
        assert(ch.size() == 2);
    }

    // 가득 찬 채널의 send는 소비자가 꺼낼 때까지 대기
    {
        Channel<int> ch(1);
        assert(ch.send(1));
        std::thread producer([&] { assert(ch.send(2)); });
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        assert(ch.size() == 1);
        assert(*ch.receive() == 1);
        producer.join();
        assert(*ch.receive() == 2);
    }

    // close는 대기 중인 receive를 깨운다
    {
        Channel<int> ch(1);
        std::thread consumer([&] { assert(!ch.receive().has_value()); });
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        ch.close();
        consumer.join();
    }

    // Broadcast: 구독자마다 같은 순서로 전달
    {
        Broadcast<int> bus(8);
        auto a = bus.subscribe();
        auto b = bus.subscribe();
        assert(bus.subscriberCount() == 2);
        for (int i = 0; i < 5; ++i) {
            assert(bus.send(i));
        }
        bus.close();
        assert(!bus.send(99));

        std::vector<int> got_a;
        std::vector<int> got_b;
        while (auto v = a->receive()) got_a.push_back(*v);
        while (auto v = b->receive()) got_b.push_back(*v);
        assert((got_a == std::vector<int>{0, 1, 2, 3, 4}));
        assert(got_a == got_b);
    }

    // 여러 생산자 -> 하나의 채널 (fan-in)
    {
        Channel<int> ch(16);
        std::thread p1([&] { for (int i = 0; i < 100; ++i) ch.send(i); });
        std::thread p2([&] { for (int i = 0; i < 100; ++i) ch.send(1000 + i); });
        int count = 0;
        int last_p1 = -1;
        int last_p2 = 999;
        while (count < 200) {
            auto v = ch.receive();
            assert(v.has_value());
            if (*v < 1000) {
                assert(*v > last_p1);
                last_p1 = *v;
            } else {
                assert(*v > last_p2);
                last_p2 = *v;
            }
            ++count;
        }
        p1.join();
        p2.join();
    }

    std::cout << "[TEST] Channel/Broadcast PASSED\n";
    return 0;
}
