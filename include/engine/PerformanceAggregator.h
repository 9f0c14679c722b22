#pragma once

#include "common/Types.h"
#include "risk/PositionLifecycle.h"
#include <map>
#include <vector>

namespace swingrisk {
namespace engine {

struct RegimePerformanceStats {
    int trades = 0;
    int wins = 0;
    double total_return = 0.0;

    double averageReturn() const {
        return (trades > 0) ? (total_return / static_cast<double>(trades)) : 0.0;
    }
    double winRate() const {
        return (trades > 0) ? (static_cast<double>(wins) / static_cast<double>(trades)) : 0.0;
    }
};

// 모든 수익률은 분수 (0.05 = 5%)
struct PerformanceSummary {
    int total_trades = 0;
    double total_return = 0.0;
    double average_return = 0.0;
    double win_rate = 0.0;
    double max_win = 0.0;
    double max_loss = 0.0;
    double volatility = 0.0;
    double sharpe_ratio = 0.0;
    double current_drawdown = 0.0;
    double max_drawdown = 0.0;
    double annualized_roi = 0.0;
    double calmar_ratio = 0.0;
    std::map<RegimeType, RegimePerformanceStats> by_regime;
};

// Stateless statistics over closed-trade returns.
// Equity curve = cumulative product of (1 + r), drawdown vs. its running max.
class PerformanceAggregator {
public:
    // 5-day swing holding period -> 252/5 periods per year
    static constexpr double kPeriodsPerYear = 252.0 / 5.0;

    static PerformanceSummary summarize(const std::vector<double>& returns);
    static PerformanceSummary summarize(const std::vector<risk::ClosedTrade>& trades);

    static double sharpeRatio(const std::vector<double>& returns);
    static std::vector<double> equityCurve(const std::vector<double>& returns);
    static double currentDrawdown(const std::vector<double>& returns);
    static double maxDrawdown(const std::vector<double>& returns);
};

} // namespace engine
} // namespace swingrisk
