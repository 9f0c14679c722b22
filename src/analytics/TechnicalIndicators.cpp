#include "analytics/TechnicalIndicators.h"
#include <algorithm>
#include <cmath>
#include <numeric>

namespace swingrisk {
namespace analytics {

double TechnicalIndicators::calculateTrueRange(double high, double low, double prev_close) {
    double tr1 = high - low;
    double tr2 = std::abs(high - prev_close);
    double tr3 = std::abs(low - prev_close);
    return std::max({tr1, tr2, tr3});
}

double TechnicalIndicators::calculateTrueRange(const DailyBar& bar, double prev_close) {
    return calculateTrueRange(bar.high, bar.low, prev_close);
}

std::vector<double> TechnicalIndicators::calculateTrueRanges(const std::vector<DailyBar>& bars) {
    std::vector<double> tr_values;
    if (bars.empty()) {
        return tr_values;
    }
    tr_values.reserve(bars.size());
    tr_values.push_back(bars.front().high - bars.front().low);

    for (size_t i = 1; i < bars.size(); ++i) {
        tr_values.push_back(calculateTrueRange(bars[i], bars[i - 1].close));
    }
    return tr_values;
}

double TechnicalIndicators::calculateMean(const std::vector<double>& values) {
    if (values.empty()) return 0.0;
    return std::accumulate(values.begin(), values.end(), 0.0) / static_cast<double>(values.size());
}

double TechnicalIndicators::calculateStandardDeviation(const std::vector<double>& values, double mean) {
    if (values.empty()) return 0.0;

    double variance = 0.0;
    for (double v : values) {
        variance += (v - mean) * (v - mean);
    }
    variance /= static_cast<double>(values.size());
    return std::sqrt(variance);
}

void TrueRangeHistory::record(const std::string& symbol, double true_range) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& window = windows_[symbol];
    window.push_back(true_range);
    while (window.size() > kWindow) {
        window.pop_front();
    }
}

double TrueRangeHistory::volatilityFactor(const std::string& symbol, double current_true_range) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = windows_.find(symbol);
    if (it == windows_.end() || it->second.empty()) {
        return 1.0;
    }

    // 현재 TR 포함 최근 kWindow개 평균
    const auto& window = it->second;
    const std::size_t prior = std::min(window.size(), kWindow - 1);
    const double sum = std::accumulate(window.end() - static_cast<std::ptrdiff_t>(prior), window.end(), 0.0)
                     + current_true_range;
    const double mean = sum / static_cast<double>(prior + 1);
    if (mean <= 1e-12) {
        return 1.0;
    }
    return current_true_range / mean;
}

std::vector<double> TrueRangeHistory::observations(const std::string& symbol) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = windows_.find(symbol);
    if (it == windows_.end()) {
        return {};
    }
    return std::vector<double>(it->second.begin(), it->second.end());
}

void TrueRangeHistory::clear(const std::string& symbol) {
    std::lock_guard<std::mutex> lock(mutex_);
    windows_.erase(symbol);
}

} // namespace analytics
} // namespace swingrisk
