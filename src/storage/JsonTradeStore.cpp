#include "storage/JsonTradeStore.h"

#include "common/Error.h"
#include "common/Logger.h"
#include "network/JwtGenerator.h"

#include <algorithm>
#include <fstream>
#include <system_error>

namespace autocoin {
namespace storage {

namespace {
nlohmann::json readJsonFile(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) {
        throw TradingError(ErrorCode::STORAGE, "cannot open " + path.string());
    }
    auto j = nlohmann::json::parse(in, nullptr, false);
    if (j.is_discarded()) {
        throw TradingError(ErrorCode::STORAGE, "corrupted store file: " + path.string());
    }
    return j;
}

template<typename T>
void putOptional(nlohmann::json& j, const char* key, const std::optional<T>& value) {
    if (value) {
        j[key] = *value;
    } else {
        j[key] = nullptr;
    }
}

template<typename T>
std::optional<T> getOptional(const nlohmann::json& j, const char* key) {
    if (!j.contains(key) || j[key].is_null()) {
        return std::nullopt;
    }
    return j[key].get<T>();
}
}

JsonTradeStore::JsonTradeStore(std::filesystem::path data_dir)
    : positions_path_(data_dir / "positions.json")
    , orders_path_(data_dir / "orders.json")
{
    std::error_code ec;
    std::filesystem::create_directories(data_dir, ec);
    if (ec) {
        throw TradingError(ErrorCode::STORAGE, "cannot create data dir: " + data_dir.string());
    }
    loadFromDisk();
}

void JsonTradeStore::loadFromDisk() {
    try {
        if (std::filesystem::exists(positions_path_)) {
            auto j = readJsonFile(positions_path_);
            for (const auto& item : j.value("positions", nlohmann::json::array())) {
                positions_.push_back(positionFromJson(item));
            }
        }
        if (std::filesystem::exists(orders_path_)) {
            auto j = readJsonFile(orders_path_);
            for (const auto& item : j.value("orders", nlohmann::json::array())) {
                orders_.push_back(orderFromJson(item));
            }
        }
    } catch (const nlohmann::json::exception& e) {
        throw TradingError(ErrorCode::STORAGE, std::string("invalid store record: ") + e.what());
    }

    LOG_INFO("[Store] 로드 완료: 포지션 {}건, 주문 {}건", positions_.size(), orders_.size());
}

bool JsonTradeStore::savePosition(const Position& position) {
    std::lock_guard<std::mutex> lock(mutex_);

    Position record = position;
    if (record.id.empty()) {
        record.id = network::JwtGenerator::generateUUID();
    }

    auto it = std::find_if(positions_.begin(), positions_.end(),
                           [&](const Position& p) { return p.id == record.id; });
    if (it != positions_.end()) {
        *it = record;
    } else {
        positions_.push_back(record);
    }
    return persistPositions();
}

bool JsonTradeStore::closePosition(const std::string& market, Price exit_price,
                                   Amount pnl, double pnl_rate) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = std::find_if(positions_.begin(), positions_.end(), [&](const Position& p) {
        return p.market == market && p.status == PositionStatus::ACTIVE;
    });
    if (it == positions_.end()) {
        LOG_WARN("[Store] 청산할 활성 포지션 없음: {}", market);
        return false;
    }

    it->status = PositionStatus::CLOSED;
    it->exit_price = exit_price;
    it->exit_time = nowMs();
    it->pnl = pnl;
    it->pnl_rate = pnl_rate;
    return persistPositions();
}

std::vector<Position> JsonTradeStore::getAllActivePositions() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<Position> active;
    std::copy_if(positions_.begin(), positions_.end(), std::back_inserter(active),
                 [](const Position& p) { return p.status == PositionStatus::ACTIVE; });
    return active;
}

std::optional<Position> JsonTradeStore::getActivePosition(const std::string& market) {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& p : positions_) {
        if (p.market == market && p.status == PositionStatus::ACTIVE) {
            return p;
        }
    }
    return std::nullopt;
}

std::vector<Position> JsonTradeStore::getAllPositions() {
    std::lock_guard<std::mutex> lock(mutex_);
    return positions_;
}

bool JsonTradeStore::saveOrder(const Order& order) {
    std::lock_guard<std::mutex> lock(mutex_);

    Order record = order;
    if (record.id.empty()) {
        record.id = network::JwtGenerator::generateUUID();
    }

    auto it = std::find_if(orders_.begin(), orders_.end(),
                           [&](const Order& o) { return o.id == record.id; });
    if (it != orders_.end()) {
        *it = record;
    } else {
        orders_.push_back(record);
    }
    return persistOrders();
}

std::vector<Order> JsonTradeStore::getOrders() {
    std::lock_guard<std::mutex> lock(mutex_);
    return orders_;
}

bool JsonTradeStore::persistPositions() {
    nlohmann::json raw;
    raw["schema_version"] = 1;
    raw["saved_at_ms"] = nowMs();
    raw["positions"] = nlohmann::json::array();
    for (const auto& p : positions_) {
        raw["positions"].push_back(toJson(p));
    }
    if (!writeAtomically(positions_path_, raw)) {
        LOG_ERROR("[Store] positions.json 저장 실패: {}", positions_path_.string());
        return false;
    }
    return true;
}

bool JsonTradeStore::persistOrders() {
    nlohmann::json raw;
    raw["schema_version"] = 1;
    raw["saved_at_ms"] = nowMs();
    raw["orders"] = nlohmann::json::array();
    for (const auto& o : orders_) {
        raw["orders"].push_back(toJson(o));
    }
    if (!writeAtomically(orders_path_, raw)) {
        LOG_ERROR("[Store] orders.json 저장 실패: {}", orders_path_.string());
        return false;
    }
    return true;
}

bool JsonTradeStore::writeAtomically(const std::filesystem::path& path, const nlohmann::json& content) {
    std::error_code ec;
    std::filesystem::create_directories(path.parent_path(), ec);

    auto tmp_path = path;
    tmp_path += ".tmp";

    {
        std::ofstream out(tmp_path, std::ios::binary | std::ios::trunc);
        if (!out.is_open()) {
            return false;
        }
        out << content.dump(2);
        if (!out.good()) {
            return false;
        }
    }

    ec.clear();
    std::filesystem::rename(tmp_path, path, ec);
    if (ec) {
        std::filesystem::remove(tmp_path, ec);
        return false;
    }
    return true;
}

nlohmann::json JsonTradeStore::toJson(const Position& p) {
    nlohmann::json j;
    j["id"] = p.id;
    j["market"] = p.market;
    j["entry_price"] = p.entry_price;
    j["amount"] = p.amount;
    j["entry_time"] = p.entry_time;
    j["stop_loss"] = p.stop_loss;
    j["take_profit"] = p.take_profit;
    j["status"] = toString(p.status);
    putOptional(j, "exit_price", p.exit_price);
    putOptional(j, "exit_time", p.exit_time);
    putOptional(j, "pnl", p.pnl);
    putOptional(j, "pnl_rate", p.pnl_rate);
    return j;
}

Position JsonTradeStore::positionFromJson(const nlohmann::json& j) {
    Position p;
    p.id = j.value("id", "");
    p.market = j.at("market").get<std::string>();
    p.entry_price = j.at("entry_price").get<double>();
    p.amount = j.at("amount").get<double>();
    p.entry_time = j.value("entry_time", 0LL);
    p.stop_loss = j.at("stop_loss").get<double>();
    p.take_profit = j.at("take_profit").get<double>();
    p.status = positionStatusFromString(j.value("status", "active"));
    p.exit_price = getOptional<double>(j, "exit_price");
    p.exit_time = getOptional<long long>(j, "exit_time");
    p.pnl = getOptional<double>(j, "pnl");
    p.pnl_rate = getOptional<double>(j, "pnl_rate");
    return p;
}

nlohmann::json JsonTradeStore::toJson(const Order& o) {
    nlohmann::json j;
    j["id"] = o.id;
    j["market"] = o.market;
    j["side"] = toString(o.side);
    j["price"] = o.price;
    j["volume"] = o.volume;
    j["status"] = toString(o.status);
    j["created_at"] = o.created_at;
    j["executed_volume"] = o.executed_volume;
    j["executed_amount"] = o.executed_amount;
    return j;
}

Order JsonTradeStore::orderFromJson(const nlohmann::json& j) {
    Order o;
    o.id = j.at("id").get<std::string>();
    o.market = j.value("market", "");
    o.side = orderSideFromString(j.value("side", "bid"));
    o.price = j.value("price", 0.0);
    o.volume = j.value("volume", 0.0);
    o.status = orderStatusFromString(j.value("status", "failed"));
    o.created_at = j.value("created_at", 0LL);
    o.executed_volume = j.value("executed_volume", 0.0);
    o.executed_amount = j.value("executed_amount", 0.0);
    return o;
}

} // namespace storage
} // namespace autocoin
