#pragma once

#include <string>
#include <vector>
#include <mutex>
#include <nlohmann/json.hpp>

namespace autocoin {

struct TradingConfig {
    std::vector<std::string> markets{"KRW-BTC"};
    std::string subscription_type = "trade";   // trade | ticker
    double profit_rate = 0.10;
    double stop_loss_rate = 0.05;
    double surge_threshold = 0.05;
    int surge_timeframe_minutes = 60;
    double volume_multiplier = 2.0;
    double min_order_amount = 5000.0;
    double max_position_ratio = 0.5;
    int max_positions = 1;
    std::size_t history_capacity = 10000;
};

struct StreamConfig {
    std::string url = "wss://api.upbit.com/websocket/v1";
    int max_retries = 5;
    long long retry_delay_ms = 5000;
    long long summary_interval_ms = 60000;
};

struct ExecutionConfig {
    std::string api_url = "https://api.upbit.com";
    int max_retries = 3;
    long long retry_base_delay_ms = 1000;
    int fill_poll_attempts = 10;
    long long fill_poll_interval_ms = 200;
    long long reconcile_interval_ms = 5000;   // 미체결 주문 재조회
};

struct RiskConfig {
    long long position_refresh_ms = 1000;
    long long exit_retry_ms = 30000;
};

struct PipelineConfig {
    std::size_t channel_capacity = 1000;
    std::size_t notification_capacity = 100;
};

struct DiscordConfig {
    bool enabled = false;
    std::string webhook_url;
    bool notify_on_buy = true;
    bool notify_on_sell = true;
    bool notify_on_error = true;
};

struct SystemConfig {
    std::string data_dir = "data";
    std::string log_dir = "logs";
    std::string log_level = "info";
};

class Config {
public:
    static Config& getInstance();

    // 파일이 없으면 기본값 유지. 파싱 실패는 TradingError(CONFIG)
    void load(const std::string& config_path);
    void loadFromJson(const nlohmann::json& j);

    // UPBIT_* / DISCORD_* / AUTOCOIN_* 등 환경 변수 반영
    void applyEnvironment();

    // 범위 밖 값이면 TradingError(CONFIG)
    void validate() const;

    // 기본값으로 되돌림 (테스트용)
    void reset();

    std::string getAccessKey() const { return access_key_; }
    std::string getSecretKey() const { return secret_key_; }

    const TradingConfig& trading() const { return trading_; }
    const StreamConfig& stream() const { return stream_; }
    const ExecutionConfig& execution() const { return execution_; }
    const RiskConfig& risk() const { return risk_; }
    const PipelineConfig& pipeline() const { return pipeline_; }
    const DiscordConfig& discord() const { return discord_; }
    const SystemConfig& system() const { return system_; }

private:
    Config() = default;

    std::string access_key_;
    std::string secret_key_;

    TradingConfig trading_;
    StreamConfig stream_;
    ExecutionConfig execution_;
    RiskConfig risk_;
    PipelineConfig pipeline_;
    DiscordConfig discord_;
    SystemConfig system_;
};

} // namespace autocoin
