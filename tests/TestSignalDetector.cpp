#include "agents/SignalDetector.h"
#include "TestFakes.h"

#include <cassert>
#include <iostream>
#include <thread>

using namespace autocoin;
using autocoin::agents::SignalDetector;
using autocoin::testing::makeTick;
using autocoin::testing::near;

int main() {
    TradingConfig config;
    config.surge_threshold = 0.05;
    config.surge_timeframe_minutes = 60;
    config.volume_multiplier = 2.0;

    // 10% 상승 + 거래량 2.5배 -> Buy
    {
        SignalDetector detector(config);
        assert(!detector.onTick(makeTick("KRW-BTC", 100.0, 1.0, 1000)));
        assert(!detector.onTick(makeTick("KRW-BTC", 101.0, 1.0, 2000)));
        auto signal = detector.onTick(makeTick("KRW-BTC", 110.0, 10.0, 3000));
        assert(signal.has_value());
        assert(signal->kind == SignalKind::BUY);
        assert(signal->market == "KRW-BTC");
        assert(signal->timestamp == 3000);
        assert(signal->reason == "Price surged 10.00% with 2.5x volume");
        const double expected = SignalDetector::confidence(110.0 / 100.0 - 1.0, 0.05, 2.5, 2.0);
        assert(near(signal->confidence, expected));
        assert(near(signal->confidence, 0.6 + 0.4 * (1.25 / 3.0), 1e-9));
    }

    // tick 1건으로는 신호 없음
    {
        SignalDetector detector(config);
        assert(!detector.onTick(makeTick("KRW-BTC", 100.0, 1.0, 1000)));
    }

    // 가격은 올랐지만 거래량 부족
    {
        SignalDetector detector(config);
        detector.onTick(makeTick("KRW-BTC", 100.0, 1.0, 1000));
        assert(!detector.onTick(makeTick("KRW-BTC", 110.0, 1.5, 2000)));
    }

    // 다른 마켓 tick은 비교 대상이 아니다
    {
        SignalDetector detector(config);
        detector.onTick(makeTick("KRW-ETH", 100.0, 1.0, 1000));
        detector.onTick(makeTick("KRW-ETH", 100.0, 1.0, 1500));
        assert(!detector.onTick(makeTick("KRW-BTC", 200.0, 10.0, 2000)));
        assert(detector.windowSize() == 3);
    }

    // lookback 밖의 오래된 tick은 제외
    {
        TradingConfig short_cfg = config;
        short_cfg.surge_timeframe_minutes = 1;
        SignalDetector detector(short_cfg);
        detector.onTick(makeTick("KRW-BTC", 50.0, 1.0, 0));
        detector.onTick(makeTick("KRW-BTC", 100.0, 1.0, 100000));
        // 기준가 100 (50은 60초 이전) -> 4% 상승으로 조건 미달
        assert(!detector.onTick(makeTick("KRW-BTC", 104.0, 10.0, 110000)));
    }

    // 윈도우 용량 제한
    {
        TradingConfig small = config;
        small.history_capacity = 3;
        SignalDetector detector(small);
        for (int i = 0; i < 10; ++i) {
            detector.onTick(makeTick("KRW-BTC", 100.0, 1.0, 1000 + i));
        }
        assert(detector.windowSize() == 3);
    }

    // confidence 상한
    assert(near(SignalDetector::confidence(1.0, 0.05, 100.0, 2.0), 1.0));

    // run: 입력 채널이 닫히면 종료
    {
        SignalDetector detector(config);
        Channel<Tick> ticks(16);
        Channel<Signal> signals(16);
        ticks.send(makeTick("KRW-BTC", 100.0, 1.0, 1000));
        ticks.send(makeTick("KRW-BTC", 101.0, 1.0, 2000));
        ticks.send(makeTick("KRW-BTC", 110.0, 10.0, 3000));
        ticks.close();
        std::thread worker([&] { detector.run(ticks, signals); });
        worker.join();
        assert(signals.size() == 1);
        assert(signals.tryReceive()->kind == SignalKind::BUY);
    }

    std::cout << "[TEST] SignalDetector PASSED\n";
    return 0;
}
