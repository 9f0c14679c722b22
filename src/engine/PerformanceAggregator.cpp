#include "engine/PerformanceAggregator.h"
#include "analytics/TechnicalIndicators.h"

#include <algorithm>
#include <cmath>

namespace swingrisk {
namespace engine {
namespace {
constexpr double MIN_CALMAR_DRAWDOWN = 0.01;

std::vector<double> drawdowns(const std::vector<double>& returns) {
    const std::vector<double> curve = PerformanceAggregator::equityCurve(returns);
    std::vector<double> out;
    out.reserve(curve.size());

    double running_max = 0.0;
    for (std::size_t i = 0; i < curve.size(); ++i) {
        running_max = (i == 0) ? curve[i] : std::max(running_max, curve[i]);
        out.push_back(running_max > 0.0 ? (curve[i] - running_max) / running_max : 0.0);
    }
    return out;
}
}

std::vector<double> PerformanceAggregator::equityCurve(const std::vector<double>& returns) {
    std::vector<double> curve;
    curve.reserve(returns.size());
    double equity = 1.0;
    for (double r : returns) {
        equity *= (1.0 + r);
        curve.push_back(equity);
    }
    return curve;
}

double PerformanceAggregator::currentDrawdown(const std::vector<double>& returns) {
    const std::vector<double> dd = drawdowns(returns);
    return dd.empty() ? 0.0 : dd.back();
}

double PerformanceAggregator::maxDrawdown(const std::vector<double>& returns) {
    const std::vector<double> dd = drawdowns(returns);
    return dd.empty() ? 0.0 : *std::min_element(dd.begin(), dd.end());
}

double PerformanceAggregator::sharpeRatio(const std::vector<double>& returns) {
    if (returns.empty()) {
        return 0.0;
    }
    const double mean = analytics::TechnicalIndicators::calculateMean(returns);
    const double stddev = analytics::TechnicalIndicators::calculateStandardDeviation(returns, mean);
    if (stddev <= 1e-12) {
        return 0.0;
    }
    return (mean / stddev) * std::sqrt(kPeriodsPerYear);
}

PerformanceSummary PerformanceAggregator::summarize(const std::vector<double>& returns) {
    PerformanceSummary s;
    if (returns.empty()) {
        return s;
    }

    s.total_trades = static_cast<int>(returns.size());
    int wins = 0;
    for (double r : returns) {
        s.total_return += r;
        if (r > 0.0) {
            wins++;
        }
    }
    s.average_return = s.total_return / static_cast<double>(returns.size());
    s.win_rate = static_cast<double>(wins) / static_cast<double>(returns.size());
    s.max_win = *std::max_element(returns.begin(), returns.end());
    s.max_loss = *std::min_element(returns.begin(), returns.end());
    s.volatility = analytics::TechnicalIndicators::calculateStandardDeviation(returns, s.average_return);
    s.sharpe_ratio = sharpeRatio(returns);
    s.current_drawdown = currentDrawdown(returns);
    s.max_drawdown = maxDrawdown(returns);
    s.annualized_roi = s.average_return * kPeriodsPerYear;
    s.calmar_ratio = s.total_return / std::max(std::fabs(s.max_drawdown), MIN_CALMAR_DRAWDOWN);
    return s;
}

PerformanceSummary PerformanceAggregator::summarize(const std::vector<risk::ClosedTrade>& trades) {
    std::vector<double> returns;
    returns.reserve(trades.size());
    for (const auto& trade : trades) {
        returns.push_back(trade.realized_return);
    }

    PerformanceSummary s = summarize(returns);
    for (const auto& trade : trades) {
        RegimePerformanceStats& stats = s.by_regime[trade.regime_at_entry];
        stats.trades++;
        stats.total_return += trade.realized_return;
        if (trade.realized_return > 0.0) {
            stats.wins++;
        }
    }
    return s;
}

} // namespace engine
} // namespace swingrisk
