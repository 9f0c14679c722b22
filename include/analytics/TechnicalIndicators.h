#pragma once

#include <deque>
#include <map>
#include <mutex>
#include <string>
#include <vector>
#include "common/Types.h"

namespace swingrisk {
namespace analytics {

class TechnicalIndicators {
public:
    // True Range = max(high-low, |high-prevClose|, |low-prevClose|)
    static double calculateTrueRange(const DailyBar& bar, double prev_close);
    static double calculateTrueRange(double high, double low, double prev_close);

    // 첫 봉만 있으면 high-low
    static std::vector<double> calculateTrueRanges(const std::vector<DailyBar>& bars);

    static double calculateMean(const std::vector<double>& values);
    // Population standard deviation
    static double calculateStandardDeviation(const std::vector<double>& values, double mean);
};

// Rolling per-symbol True Range window used for volatility normalization.
class TrueRangeHistory {
public:
    static constexpr std::size_t kWindow = 5;

    void record(const std::string& symbol, double true_range);

    // current / mean(current + last kWindow-1 recorded), 1.0 without history
    double volatilityFactor(const std::string& symbol, double current_true_range) const;

    std::vector<double> observations(const std::string& symbol) const;
    void clear(const std::string& symbol);

private:
    mutable std::mutex mutex_;
    std::map<std::string, std::deque<double>> windows_;
};

} // namespace analytics
} // namespace swingrisk
