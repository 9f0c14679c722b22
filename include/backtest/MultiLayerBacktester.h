#pragma once

#include "analytics/RegimeClassifier.h"
#include "common/Types.h"
#include "engine/PerformanceAggregator.h"
#include "risk/PositionLifecycle.h"
#include "risk/RegimeConfig.h"
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace swingrisk {
namespace backtest {

// 과거 거래 1건: 진입 정보 + 진입 이후 일봉
struct HistoricalTrade {
    std::string symbol;
    double entry_price = 0.0;
    int entry_day = 0;
    double vix_at_entry = 0.0;
    std::optional<double> t2108;
    std::optional<double> momentum_ratio;
    std::optional<double> true_range;
    std::vector<DailyBar> bars;
};

enum class BacktestLayer {
    BASELINE,
    STOP_ONLY,
    PROFIT_ONLY,
    COMBINED
};

inline const char* backtestLayerToString(BacktestLayer layer) {
    switch (layer) {
        case BacktestLayer::BASELINE: return "baseline";
        case BacktestLayer::STOP_ONLY: return "stop_only";
        case BacktestLayer::PROFIT_ONLY: return "profit_only";
        case BacktestLayer::COMBINED: return "combined";
    }
    return "unknown";
}

struct BacktestConfig {
    int baseline_hold_days = 5;
    int workers = 0;              // 0 = hardware_concurrency
};

struct LayerReport {
    BacktestLayer layer = BacktestLayer::BASELINE;
    engine::PerformanceSummary performance;
    std::vector<risk::ClosedTrade> trades;
    std::map<std::string, int> exit_reason_counts;
    double composite_score = 0.0;
    double incremental_return = 0.0;      // total_return - baseline total_return
    double drawdown_reduction = 0.0;      // |baseline maxDD| - |maxDD|
};

struct ComparativeReport {
    int trade_count = 0;
    std::vector<LayerReport> layers;      // BacktestLayer 순서
    std::vector<BacktestLayer> ranking;   // composite score 내림차순

    const LayerReport& layer(BacktestLayer which) const;
    BacktestLayer best() const { return ranking.front(); }
};

struct GridSearchSpace {
    std::vector<analytics::RegimeBands> vix_bands;
    std::vector<double> stop_scalars;
    std::vector<double> profit_scalars;

    static GridSearchSpace defaults();
    std::size_t size() const { return vix_bands.size() * stop_scalars.size() * profit_scalars.size(); }
};

struct GridCandidate {
    analytics::RegimeBands bands;
    double stop_scalar = 1.0;
    double profit_scalar = 1.0;
};

struct CandidateScore {
    GridCandidate candidate;
    double composite_score = 0.0;
    engine::PerformanceSummary performance;
};

struct OptimizationResult {
    bool found = false;
    CandidateScore best;
    std::vector<CandidateScore> evaluated;  // 후보 순서 유지
    int skipped_candidates = 0;
};

// Replays historical trades through the lifecycle with rule layers switched
// on one at a time, then compares the passes.
// Every pass (and every grid candidate) runs on a fresh PositionLifecycle.
class MultiLayerBacktester {
public:
    explicit MultiLayerBacktester(
        const risk::RegimeConfigTable& configs = risk::RegimeConfigTable::defaults(),
        const analytics::RegimeClassifier& classifier = analytics::RegimeClassifier(),
        const BacktestConfig& config = BacktestConfig()
    );

    ComparativeReport run(const std::vector<HistoricalTrade>& trades) const;
    LayerReport runLayer(BacktestLayer layer, const std::vector<HistoricalTrade>& trades) const;

    // Re-runs the COMBINED pass per candidate on worker threads
    OptimizationResult optimize(const std::vector<HistoricalTrade>& trades,
                                const GridSearchSpace& space = GridSearchSpace::defaults()) const;

    static void validateTrades(const std::vector<HistoricalTrade>& trades);
    static double compositeScore(const engine::PerformanceSummary& performance);
    static risk::RuleSet rulesFor(BacktestLayer layer, int baseline_hold_days);

    const BacktestConfig& config() const { return config_; }

private:
    LayerReport replay(BacktestLayer layer,
                       const std::vector<HistoricalTrade>& trades,
                       const risk::RegimeConfigTable& configs,
                       const analytics::RegimeClassifier& classifier) const;

    risk::ClosedTrade simulateTrade(risk::PositionLifecycle& lifecycle, const HistoricalTrade& trade) const;

    risk::RegimeConfigTable configs_;
    analytics::RegimeClassifier classifier_;
    BacktestConfig config_;
};

} // namespace backtest
} // namespace swingrisk
