#include "stream/TickDecoder.h"

#include "common/Error.h"

#include <nlohmann/json.hpp>

namespace autocoin {
namespace stream {

namespace {
std::string extractJsonText(const std::string& frame) {
    if (frame.empty()) {
        throw TradingError(ErrorCode::MALFORMED_RESPONSE, "empty frame");
    }
    const char first = frame.front();
    if (first == '{' || first == '[') {
        return frame;
    }
    if (first == '\0') {
        return frame.substr(1);
    }
    throw TradingError(ErrorCode::MALFORMED_RESPONSE,
                       "unsupported frame encoding (first byte " +
                       std::to_string(static_cast<unsigned char>(first)) + ")");
}

Tick toTick(const nlohmann::json& j, const std::string& type) {
    Tick tick;
    tick.market = j.at("code").get<std::string>();
    tick.timestamp = j.at("timestamp").get<long long>();
    tick.trade_price = j.at("trade_price").get<double>();
    tick.change_rate = j.value("change_rate", 0.0);
    tick.volume = j.at("trade_volume").get<double>();

    if (type == "ticker") {
        tick.trade_amount = j.value("acc_trade_price", 0.0);
    } else {
        tick.trade_amount = tick.trade_price * tick.volume;
    }
    return tick;
}
}

std::optional<Tick> TickDecoder::decode(const std::string& frame) {
    const std::string text = extractJsonText(frame);

    auto j = nlohmann::json::parse(text, nullptr, false);
    if (j.is_discarded()) {
        throw TradingError(ErrorCode::MALFORMED_RESPONSE, "frame is not valid JSON");
    }

    try {
        // 일부 응답은 단일 원소 배열로 온다
        if (j.is_array()) {
            if (j.empty()) {
                return std::nullopt;
            }
            j = j.front();
        }
        if (!j.is_object()) {
            throw TradingError(ErrorCode::MALFORMED_RESPONSE, "frame is not a JSON object");
        }

        auto type_it = j.find("type");
        if (type_it == j.end()) {
            return std::nullopt;
        }
        if (!type_it->is_string()) {
            throw TradingError(ErrorCode::MALFORMED_RESPONSE, "frame type is not a string");
        }

        const std::string type = type_it->get<std::string>();
        if (type != "trade" && type != "ticker") {
            return std::nullopt;
        }
        return toTick(j, type);
    } catch (const nlohmann::json::exception& e) {
        throw TradingError(ErrorCode::MALFORMED_RESPONSE,
                           std::string("invalid frame field: ") + e.what());
    }
}

std::string TickDecoder::buildSubscription(const std::string& ticket,
                                           const std::string& type,
                                           const std::vector<std::string>& markets) {
    nlohmann::ordered_json msg;
    msg["ticket"] = ticket;
    msg["type"] = type;
    msg["codes"] = markets;
    return msg.dump();
}

} // namespace stream
} // namespace autocoin
