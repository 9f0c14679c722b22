#include "backtest/DataHistory.h"
#include <fstream>
#include <nlohmann/json.hpp>
#include "common/Errors.h"
#include "common/Logger.h"
#include "core/report/ReportSchema.h"

namespace swingrisk {
namespace backtest {

std::vector<HistoricalTrade> DataHistory::loadJSON(const std::string& file_path) {
    std::ifstream file(file_path);
    if (!file.is_open()) {
        LOG_ERROR("Failed to open JSON file: {}", file_path);
        throw InvalidInput("cannot open trade file: " + file_path);
    }

    nlohmann::json j;
    try {
        file >> j;
    } catch (const nlohmann::json::exception& e) {
        LOG_ERROR("Error parsing JSON file: {} - {}", file_path, e.what());
        throw InvalidInput(file_path + ": " + e.what());
    }

    const nlohmann::json* items = &j;
    if (j.is_object() && j.contains("trades")) {
        items = &j["trades"];
    }
    if (!items->is_array()) {
        throw InvalidInput(file_path + ": expected an array of trades");
    }

    std::vector<HistoricalTrade> trades;
    trades.reserve(items->size());
    for (const auto& item : *items) {
        trades.push_back(core::report::historicalTradeFromJson(item));
    }

    LOG_INFO("Loaded {} historical trades from {}", trades.size(), file_path);
    return trades;
}

void DataHistory::saveJSON(const std::string& file_path, const std::vector<HistoricalTrade>& trades) {
    nlohmann::json out;
    out["trades"] = nlohmann::json::array();
    for (const auto& trade : trades) {
        out["trades"].push_back(core::report::toJson(trade));
    }

    std::ofstream file(file_path, std::ios::binary | std::ios::trunc);
    if (!file.is_open()) {
        throw RiskError("cannot write trade file: " + file_path);
    }
    file << out.dump(2) << "\n";
}

} // namespace backtest
} // namespace swingrisk
