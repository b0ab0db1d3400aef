#include "common/Config.h"
#include "common/Error.h"
#include "common/Logger.h"
#include "common/PathUtils.h"
#include "common/RateLimitedLogger.h"
#include "core/orchestration/TradingPipeline.h"
#include "exchange/UpbitExchangeClient.h"
#include "execution/RateLimiter.h"
#include "network/UpbitHttpClient.h"
#include "network/UpbitWebSocketTransport.h"
#include "notification/DiscordNotifier.h"
#include "storage/JsonTradeStore.h"

#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
#include <string>

using namespace autocoin;

namespace {
std::atomic<bool> g_shutdown{false};

void signalHandler(int) {
    g_shutdown = true;
}

std::unique_ptr<core::TradingPipeline> buildPipeline(const Config& config) {
    const auto& trading = config.trading();
    const auto& exec_cfg = config.execution();

    auto rate_limiter = std::make_shared<execution::RateLimiter>();
    auto http = std::make_shared<network::UpbitHttpClient>(
        config.getAccessKey(), config.getSecretKey(), exec_cfg.api_url, rate_limiter);

    exchange::FillPollConfig fill_poll;
    fill_poll.attempts = exec_cfg.fill_poll_attempts;
    fill_poll.interval = std::chrono::milliseconds(exec_cfg.fill_poll_interval_ms);
    auto exchange = std::make_shared<exchange::UpbitExchangeClient>(http, fill_poll);

    auto store = std::make_shared<storage::JsonTradeStore>(
        utils::PathUtils::resolveRelativePath(config.system().data_dir));

    auto notifier = std::make_shared<notification::DiscordNotifier>(config.discord());

    stream::StreamOptions stream_options;
    stream_options.url = config.stream().url;
    stream_options.subscription_type = trading.subscription_type;
    stream_options.max_retries = config.stream().max_retries;
    stream_options.retry_delay = std::chrono::milliseconds(config.stream().retry_delay_ms);

    auto summary_log = std::make_shared<RateLimitedLogger>(
        std::chrono::milliseconds(config.stream().summary_interval_ms));

    agents::RiskOptions risk_options;
    risk_options.position_refresh = std::chrono::milliseconds(config.risk().position_refresh_ms);
    risk_options.exit_retry = std::chrono::milliseconds(config.risk().exit_retry_ms);

    agents::ExecutionOptions exec_options;
    exec_options.max_retries = exec_cfg.max_retries;
    exec_options.retry_base_delay = std::chrono::milliseconds(exec_cfg.retry_base_delay_ms);
    exec_options.reconcile_interval = std::chrono::milliseconds(exec_cfg.reconcile_interval_ms);
    exec_options.take_profit_rate = trading.profit_rate;
    exec_options.stop_loss_rate = trading.stop_loss_rate;

    core::PipelineComponents components;
    components.stream = std::make_unique<stream::MarketDataStream>(
        std::make_unique<network::UpbitWebSocketTransport>(), stream_options, summary_log);
    components.signal_detector = std::make_unique<agents::SignalDetector>(trading);
    components.decision_maker = std::make_shared<agents::DecisionMaker>(trading, store);
    components.risk_manager = std::make_unique<agents::RiskManager>(store, risk_options);
    components.execution_agent = std::make_unique<agents::ExecutionAgent>(exchange, store, exec_options);
    components.exchange = exchange;
    components.notifier = notifier;

    core::PipelineOptions options;
    options.markets = trading.markets;
    options.channel_capacity = config.pipeline().channel_capacity;
    options.notification_capacity = config.pipeline().notification_capacity;

    return std::make_unique<core::TradingPipeline>(options, std::move(components));
}
}

int main(int argc, char* argv[]) {
    const std::string config_path = (argc > 1) ? argv[1] : "config/config.json";

    try {
        auto& config = Config::getInstance();
        config.load(config_path);
        config.applyEnvironment();
        config.validate();

        Logger::getInstance().initialize(config.system().log_dir, config.system().log_level);

        std::cout << "\n";
        std::cout << "=============================================\n";
        std::cout << "       AutoCoin Momentum Trader v1.0\n";
        std::cout << "       업비트 급등 감지 자동매매\n";
        std::cout << "=============================================\n\n";

        if (config.getAccessKey().empty() || config.getSecretKey().empty()) {
            throw TradingError(ErrorCode::INVALID_CREDENTIALS,
                               "UPBIT_ACCESS_KEY / UPBIT_SECRET_KEY must be set");
        }

        const auto& trading = config.trading();
        LOG_INFO("마켓: {}개, 급등 기준 {:.2f}% / {}분, 거래량 x{:.1f}",
                 trading.markets.size(), trading.surge_threshold * 100.0,
                 trading.surge_timeframe_minutes, trading.volume_multiplier);
        LOG_INFO("익절 {:.2f}%, 손절 {:.2f}%, 최소 주문 {:.0f} KRW, 비율 {:.2f}",
                 trading.profit_rate * 100.0, trading.stop_loss_rate * 100.0,
                 trading.min_order_amount, trading.max_position_ratio);

        auto pipeline = buildPipeline(config);

        std::signal(SIGINT, signalHandler);
        std::signal(SIGTERM, signalHandler);

        pipeline->start();
        std::cout << "중지하려면 Ctrl+C를 누르세요.\n\n";

        while (!g_shutdown.load()) {
            if (pipeline->waitForStreamEnd(std::chrono::milliseconds(500))) {
                LOG_ERROR("시세 스트림 종료 - 파이프라인을 정리합니다");
                break;
            }
        }

        if (g_shutdown.load()) {
            LOG_INFO("종료 신호 수신");
        }
        pipeline->stop();

        const bool failed = pipeline->streamFailed();
        LOG_INFO("Program terminated");
        Logger::getInstance().flush();
        return failed ? 1 : 0;
    } catch (const TradingError& e) {
        LOG_ERROR("Fatal error [{}]: {}", toString(e.code()), e.what());
        std::cerr << "\n오류가 발생했습니다: " << e.what() << std::endl;
        return 1;
    } catch (const std::exception& e) {
        LOG_ERROR("Fatal error: {}", e.what());
        std::cerr << "\n오류가 발생했습니다: " << e.what() << std::endl;
        return 1;
    }
}
