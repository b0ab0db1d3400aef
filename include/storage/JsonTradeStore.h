#pragma once

#include "storage/ITradeStore.h"

#include <filesystem>
#include <mutex>
#include <nlohmann/json.hpp>

namespace autocoin {
namespace storage {

// data_dir/positions.json, data_dir/orders.json (임시 파일 + rename)
class JsonTradeStore : public ITradeStore {
public:
    // 기존 파일이 손상되어 있으면 TradingError(STORAGE)
    explicit JsonTradeStore(std::filesystem::path data_dir);

    bool savePosition(const Position& position) override;
    bool closePosition(const std::string& market, Price exit_price,
                       Amount pnl, double pnl_rate) override;
    std::vector<Position> getAllActivePositions() override;
    std::optional<Position> getActivePosition(const std::string& market) override;
    bool saveOrder(const Order& order) override;
    std::vector<Order> getOrders() override;

    std::vector<Position> getAllPositions();

    static nlohmann::json toJson(const Position& position);
    static Position positionFromJson(const nlohmann::json& j);
    static nlohmann::json toJson(const Order& order);
    static Order orderFromJson(const nlohmann::json& j);

private:
    void loadFromDisk();
    bool persistPositions();
    bool persistOrders();
    static bool writeAtomically(const std::filesystem::path& path, const nlohmann::json& content);

    std::filesystem::path positions_path_;
    std::filesystem::path orders_path_;

    std::vector<Position> positions_;
    std::vector<Order> orders_;
    std::mutex mutex_;
};

} // namespace storage
} // namespace autocoin
