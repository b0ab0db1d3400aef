#include "execution/OrderStateMapper.h"

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <ctime>

namespace autocoin {
namespace execution {

namespace {
std::string normalizeState(std::string state) {
    std::transform(state.begin(), state.end(), state.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return state;
}

double readNumber(const nlohmann::json& j, const char* key) {
    if (!j.contains(key) || j[key].is_null()) {
        return 0.0;
    }
    const auto& v = j[key];
    if (v.is_number()) {
        return v.get<double>();
    }
    if (v.is_string()) {
        try {
            return std::stod(v.get<std::string>());
        } catch (const std::exception&) {
            return 0.0;
        }
    }
    return 0.0;
}
} // namespace

ExchangeOrderStateResult OrderStateMapper::map(const std::string& exchange_state, double executed_volume) {
    const std::string state = normalizeState(exchange_state);

    ExchangeOrderStateResult result;
    if (state == "done") {
        result.status = OrderStatus::EXECUTED;
        result.terminal = true;
    } else if (state == "cancel") {
        result.status = (executed_volume > 0.0) ? OrderStatus::EXECUTED : OrderStatus::CANCELED;
        result.terminal = true;
    } else if (state == "wait" || state == "watch") {
        result.status = OrderStatus::WAITING;
        result.terminal = false;
    } else {
        result.status = OrderStatus::FAILED;
        result.terminal = true;
    }
    return result;
}

Order OrderStateMapper::fromJson(const nlohmann::json& j) {
    Order order;
    order.id = j.value("uuid", "");
    order.market = j.value("market", "");
    order.side = orderSideFromString(j.value("side", "bid"));
    order.price = readNumber(j, "price");
    order.volume = readNumber(j, "volume");
    order.executed_volume = readNumber(j, "executed_volume");

    // 체결 금액: trades 합계 > executed_funds > price * executed_volume
    double funds = 0.0;
    if (j.contains("trades") && j["trades"].is_array() && !j["trades"].empty()) {
        double trade_volume = 0.0;
        for (const auto& t : j["trades"]) {
            double f = readNumber(t, "funds");
            double v = readNumber(t, "volume");
            if (f <= 0.0) {
                f = readNumber(t, "price") * v;
            }
            funds += f;
            trade_volume += v;
        }
        if (order.executed_volume <= 0.0) {
            order.executed_volume = trade_volume;
        }
    } else if (j.contains("executed_funds")) {
        funds = readNumber(j, "executed_funds");
    } else {
        funds = order.price * order.executed_volume;
    }
    order.executed_amount = funds;

    // 시장가 매수(ord_type=price)는 volume이 null
    if (order.volume <= 0.0) {
        order.volume = order.executed_volume;
    }

    const auto mapped = map(j.value("state", ""), order.executed_volume);
    order.status = mapped.status;

    const std::string created = j.value("created_at", "");
    order.created_at = created.empty() ? nowMs() : parseTimestampMs(created);
    if (order.created_at == 0) {
        order.created_at = nowMs();
    }
    return order;
}

long long OrderStateMapper::parseTimestampMs(const std::string& iso8601) {
    int year = 0, month = 0, day = 0, hour = 0, minute = 0, second = 0;
    if (std::sscanf(iso8601.c_str(), "%4d-%2d-%2dT%2d:%2d:%2d",
                    &year, &month, &day, &hour, &minute, &second) != 6) {
        return 0;
    }

    std::tm tm{};
    tm.tm_year = year - 1900;
    tm.tm_mon = month - 1;
    tm.tm_mday = day;
    tm.tm_hour = hour;
    tm.tm_min = minute;
    tm.tm_sec = second;
    long long epoch = static_cast<long long>(timegm(&tm));

    // 타임존 오프셋 (+09:00 / -05:00 / Z)
    auto tz_pos = iso8601.find_first_of("+-Z", 19);
    if (tz_pos != std::string::npos && iso8601[tz_pos] != 'Z') {
        int off_h = 0, off_m = 0;
        if (std::sscanf(iso8601.c_str() + tz_pos + 1, "%2d:%2d", &off_h, &off_m) >= 1) {
            long long offset = off_h * 3600LL + off_m * 60LL;
            epoch += (iso8601[tz_pos] == '+') ? -offset : offset;
        }
    }
    return epoch * 1000;
}

} // namespace execution
} // namespace autocoin
