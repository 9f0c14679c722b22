#pragma once

#include <string>
#include <vector>
#include "backtest/MultiLayerBacktester.h"

namespace swingrisk {
namespace backtest {

class DataHistory {
public:
    // Load historical trades from a JSON file.
    // Accepts either a top-level array or {"trades": [...]}.
    static std::vector<HistoricalTrade> loadJSON(const std::string& file_path);

    static void saveJSON(const std::string& file_path, const std::vector<HistoricalTrade>& trades);
};

} // namespace backtest
} // namespace swingrisk
