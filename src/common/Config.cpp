#include "common/Config.h"
#include "common/Error.h"
#include "common/PathUtils.h"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>

namespace autocoin {

namespace {
std::string trimCopy(std::string s) {
    auto not_space = [](unsigned char c) { return !std::isspace(c); };
    s.erase(s.begin(), std::find_if(s.begin(), s.end(), not_space));
    s.erase(std::find_if(s.rbegin(), s.rend(), not_space).base(), s.end());
    return s;
}

std::string readEnvVar(const char* name) {
    const char* value = std::getenv(name);
    return value ? trimCopy(value) : "";
}

// 숫자 환경 변수. 파싱 실패 시 경고 후 기존 값 유지
void overrideDouble(const char* name, double& target) {
    const std::string raw = readEnvVar(name);
    if (raw.empty()) {
        return;
    }
    try {
        std::size_t used = 0;
        double value = std::stod(raw, &used);
        if (used != raw.size()) {
            throw std::invalid_argument(raw);
        }
        target = value;
    } catch (const std::exception&) {
        std::cerr << "경고: 환경 변수 " << name << " 값을 해석할 수 없습니다: " << raw << std::endl;
    }
}

bool inUnitInterval(double v) {
    return v > 0.0 && v < 1.0;
}
}

Config& Config::getInstance() {
    static Config instance;
    return instance;
}

void Config::reset() {
    access_key_.clear();
    secret_key_.clear();
    trading_ = TradingConfig{};
    stream_ = StreamConfig{};
    execution_ = ExecutionConfig{};
    risk_ = RiskConfig{};
    pipeline_ = PipelineConfig{};
    discord_ = DiscordConfig{};
    system_ = SystemConfig{};
}

void Config::load(const std::string& path) {
    std::filesystem::path config_path = utils::PathUtils::resolveRelativePath(path);

    std::cout << "설정 파일 경로: " << config_path << std::endl;

    if (!std::filesystem::exists(config_path)) {
        std::cout << "경고: 설정 파일을 찾을 수 없습니다: " << config_path << std::endl;
        std::cout << "기본값을 사용합니다." << std::endl;
        return;
    }

    std::ifstream file(config_path);
    if (!file.is_open()) {
        throw TradingError(ErrorCode::CONFIG, "cannot open config file: " + config_path.string());
    }

    nlohmann::json j;
    try {
        file >> j;
    } catch (const nlohmann::json::exception& e) {
        throw TradingError(ErrorCode::CONFIG, std::string("config parse error: ") + e.what());
    }

    loadFromJson(j);
    std::cout << "설정 파일 로드 완료" << std::endl;
}

void Config::loadFromJson(const nlohmann::json& j) {
    try {
        if (j.contains("api")) {
            const std::string file_access_key = trimCopy(j["api"].value("access_key", ""));
            const std::string file_secret_key = trimCopy(j["api"].value("secret_key", ""));
            if (!file_access_key.empty() || !file_secret_key.empty()) {
                std::cout << "경고: config api 키 값은 무시됩니다. 환경 변수(UPBIT_ACCESS_KEY/UPBIT_SECRET_KEY)를 사용하세요."
                          << std::endl;
            }
            execution_.api_url = j["api"].value("url", execution_.api_url);
        }

        if (j.contains("trading")) {
            const auto& t = j["trading"];
            if (t.contains("markets")) {
                trading_.markets = t["markets"].get<std::vector<std::string>>();
            }
            trading_.subscription_type = t.value("subscription_type", trading_.subscription_type);
            trading_.profit_rate = t.value("profit_rate", trading_.profit_rate);
            trading_.stop_loss_rate = t.value("stop_loss_rate", trading_.stop_loss_rate);
            trading_.surge_threshold = t.value("surge_threshold", trading_.surge_threshold);
            trading_.surge_timeframe_minutes = t.value("surge_timeframe_minutes", trading_.surge_timeframe_minutes);
            trading_.volume_multiplier = t.value("volume_multiplier", trading_.volume_multiplier);
            trading_.min_order_amount = t.value("min_order_amount", trading_.min_order_amount);
            trading_.max_position_ratio = t.value("max_position_ratio", trading_.max_position_ratio);
            trading_.max_positions = t.value("max_positions", trading_.max_positions);
            trading_.history_capacity = t.value("history_capacity", trading_.history_capacity);
        }

        if (j.contains("stream")) {
            const auto& s = j["stream"];
            stream_.url = s.value("url", stream_.url);
            stream_.max_retries = s.value("max_retries", stream_.max_retries);
            stream_.retry_delay_ms = s.value("retry_delay_ms", stream_.retry_delay_ms);
            stream_.summary_interval_ms = s.value("summary_interval_ms", stream_.summary_interval_ms);
        }

        if (j.contains("execution")) {
            const auto& e = j["execution"];
            execution_.max_retries = e.value("max_retries", execution_.max_retries);
            execution_.retry_base_delay_ms = e.value("retry_base_delay_ms", execution_.retry_base_delay_ms);
            execution_.fill_poll_attempts = e.value("fill_poll_attempts", execution_.fill_poll_attempts);
            execution_.fill_poll_interval_ms = e.value("fill_poll_interval_ms", execution_.fill_poll_interval_ms);
            execution_.reconcile_interval_ms = e.value("reconcile_interval_ms", execution_.reconcile_interval_ms);
        }

        if (j.contains("risk")) {
            const auto& r = j["risk"];
            risk_.position_refresh_ms = r.value("position_refresh_ms", risk_.position_refresh_ms);
            risk_.exit_retry_ms = r.value("exit_retry_ms", risk_.exit_retry_ms);
        }

        if (j.contains("pipeline")) {
            const auto& p = j["pipeline"];
            pipeline_.channel_capacity = p.value("channel_capacity", pipeline_.channel_capacity);
            pipeline_.notification_capacity = p.value("notification_capacity", pipeline_.notification_capacity);
        }

        if (j.contains("discord")) {
            const auto& d = j["discord"];
            discord_.enabled = d.value("enabled", discord_.enabled);
            discord_.webhook_url = d.value("webhook_url", discord_.webhook_url);
            discord_.notify_on_buy = d.value("notify_on_buy", discord_.notify_on_buy);
            discord_.notify_on_sell = d.value("notify_on_sell", discord_.notify_on_sell);
            discord_.notify_on_error = d.value("notify_on_error", discord_.notify_on_error);
        }

        if (j.contains("system")) {
            const auto& s = j["system"];
            system_.data_dir = s.value("data_dir", system_.data_dir);
            system_.log_dir = s.value("log_dir", system_.log_dir);
        }

        if (j.contains("logging")) {
            system_.log_level = j["logging"].value("level", system_.log_level);
        }
    } catch (const nlohmann::json::exception& e) {
        throw TradingError(ErrorCode::CONFIG, std::string("config value error: ") + e.what());
    }

    // 단일 포지션만 지원
    if (trading_.max_positions != 1) {
        std::cout << "경고: max_positions=" << trading_.max_positions
                  << " 는 지원되지 않습니다. 1로 고정합니다." << std::endl;
        trading_.max_positions = 1;
    }
}

void Config::applyEnvironment() {
    access_key_ = readEnvVar("UPBIT_ACCESS_KEY");
    secret_key_ = readEnvVar("UPBIT_SECRET_KEY");
    if (access_key_.empty() || secret_key_.empty()) {
        std::cout << "경고: UPBIT_ACCESS_KEY 또는 UPBIT_SECRET_KEY 환경 변수가 비어 있습니다." << std::endl;
    }

    const std::string api_url = readEnvVar("UPBIT_API_URL");
    if (!api_url.empty()) execution_.api_url = api_url;

    const std::string ws_url = readEnvVar("UPBIT_WS_URL");
    if (!ws_url.empty()) stream_.url = ws_url;

    const std::string webhook = readEnvVar("DISCORD_WEBHOOK_URL");
    if (!webhook.empty()) {
        discord_.webhook_url = webhook;
        discord_.enabled = true;
    }

    const std::string data_dir = readEnvVar("AUTOCOIN_DATA_DIR");
    if (!data_dir.empty()) system_.data_dir = data_dir;

    const std::string log_level = readEnvVar("LOG_LEVEL");
    if (!log_level.empty()) system_.log_level = log_level;

    overrideDouble("TARGET_PROFIT_RATE", trading_.profit_rate);
    overrideDouble("STOP_LOSS_RATE", trading_.stop_loss_rate);
    overrideDouble("SURGE_THRESHOLD", trading_.surge_threshold);
    overrideDouble("MIN_ORDER_AMOUNT_KRW", trading_.min_order_amount);
}

void Config::validate() const {
    if (trading_.markets.empty()) {
        throw TradingError(ErrorCode::CONFIG, "trading.markets must not be empty");
    }
    if (trading_.subscription_type != "trade" && trading_.subscription_type != "ticker") {
        throw TradingError(ErrorCode::CONFIG, "trading.subscription_type must be trade or ticker");
    }
    if (!inUnitInterval(trading_.profit_rate)) {
        throw TradingError(ErrorCode::CONFIG, "trading.profit_rate must be in (0, 1)");
    }
    if (!inUnitInterval(trading_.stop_loss_rate)) {
        throw TradingError(ErrorCode::CONFIG, "trading.stop_loss_rate must be in (0, 1)");
    }
    if (!inUnitInterval(trading_.surge_threshold)) {
        throw TradingError(ErrorCode::CONFIG, "trading.surge_threshold must be in (0, 1)");
    }
    if (trading_.max_position_ratio <= 0.0 || trading_.max_position_ratio > 1.0) {
        throw TradingError(ErrorCode::CONFIG, "trading.max_position_ratio must be in (0, 1]");
    }
    if (trading_.surge_timeframe_minutes <= 0 || trading_.volume_multiplier <= 0.0 ||
        trading_.min_order_amount <= 0.0 || trading_.history_capacity == 0) {
        throw TradingError(ErrorCode::CONFIG, "trading window/threshold values must be positive");
    }
    if (stream_.max_retries < 0 || stream_.retry_delay_ms < 0) {
        throw TradingError(ErrorCode::CONFIG, "stream retry values must not be negative");
    }
    if (execution_.max_retries <= 0 || execution_.retry_base_delay_ms < 0 ||
        execution_.fill_poll_attempts < 0 || execution_.fill_poll_interval_ms < 0 ||
        execution_.reconcile_interval_ms <= 0) {
        throw TradingError(ErrorCode::CONFIG, "execution retry values out of range");
    }
    if (pipeline_.channel_capacity == 0 || pipeline_.notification_capacity == 0) {
        throw TradingError(ErrorCode::CONFIG, "pipeline capacities must be positive");
    }
    if (discord_.enabled && discord_.webhook_url.empty()) {
        throw TradingError(ErrorCode::CONFIG, "discord.enabled requires webhook_url");
    }
}

} // namespace autocoin
