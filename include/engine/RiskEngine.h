#pragma once

#include "analytics/RegimeClassifier.h"
#include "backtest/MultiLayerBacktester.h"
#include "common/Types.h"
#include "engine/PerformanceAggregator.h"
#include "engine/RiskEngineConfig.h"
#include "risk/PositionLifecycle.h"
#include "risk/RegimeConfig.h"
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace swingrisk {

class Config;

namespace engine {

struct OpenPositionResult {
    std::string symbol;
    RegimeType regime = RegimeType::BULL_NORMAL;
    double regime_confidence = 0.0;
    double entry_price = 0.0;
    double position_size_pct = 0.0;
    double stop_level = 0.0;
    double stop_distance_pct = 0.0;
    std::string stop_method;
    double true_range = 0.0;
    std::vector<risk::ProfitTarget> profit_targets;
    int expected_hold_days = 0;
    bool transition_detected = false;
    std::string adjustment_reason;
    double risk_score = 0.0;              // 0~100, 높을수록 위험
};

enum class RegimeStability { STABLE_LOW_VOL, STABLE_HIGH_VOL, TRANSITIONAL };

inline const char* regimeStabilityToString(RegimeStability stability) {
    switch (stability) {
        case RegimeStability::STABLE_LOW_VOL: return "stable_low_vol";
        case RegimeStability::STABLE_HIGH_VOL: return "stable_high_vol";
        case RegimeStability::TRANSITIONAL: return "transitional";
    }
    return "unknown";
}

enum class PositionHealth { CLOSED, HEALTHY_PROFIT, AT_RISK, NEUTRAL };

inline const char* positionHealthToString(PositionHealth health) {
    switch (health) {
        case PositionHealth::CLOSED: return "closed";
        case PositionHealth::HEALTHY_PROFIT: return "healthy_profit";
        case PositionHealth::AT_RISK: return "at_risk";
        case PositionHealth::NEUTRAL: return "neutral";
    }
    return "unknown";
}

enum class PerformanceTrend { INSUFFICIENT_DATA, POSITIVE, NEGATIVE };

inline const char* performanceTrendToString(PerformanceTrend trend) {
    switch (trend) {
        case PerformanceTrend::INSUFFICIENT_DATA: return "insufficient_data";
        case PerformanceTrend::POSITIVE: return "positive_trend";
        case PerformanceTrend::NEGATIVE: return "negative_trend";
    }
    return "unknown";
}

// 업데이트 직전 포지션 상태 (오늘 종가 기준)
struct PreUpdateAnalysis {
    double current_pnl_pct = 0.0;         // %
    int days_held = 0;
    double stop_distance = 0.0;           // |stop - close| / close
    bool regime_change_detected = false;  // |VIX - VIX at entry| > 10
};

struct PositionUpdateResult {
    risk::UpdateResult update;
    PreUpdateAnalysis pre_update;
    RegimeStability regime_stability = RegimeStability::TRANSITIONAL;
    PositionHealth position_health = PositionHealth::NEUTRAL;
};

struct RiskAdjustedMetrics {
    double sortino_ratio = 0.0;           // sharpe * 1.1 근사
    double win_loss_ratio = 0.0;          // |max win| / max(|max loss|, 0.01)
};

struct PortfolioPerformance {
    PerformanceSummary performance;
    int active_positions = 0;
    std::map<RegimeType, int> regime_distribution;   // 진입 레짐별 포지션 수 (청산 + 보유)
    RiskAdjustedMetrics risk_adjusted;
    PerformanceTrend trend = PerformanceTrend::INSUFFICIENT_DATA;
};

enum class AlertType { DRAWDOWN, CONCENTRATION };

inline const char* alertTypeToString(AlertType type) {
    return (type == AlertType::DRAWDOWN) ? "drawdown" : "concentration";
}

struct PortfolioAlert {
    AlertType type = AlertType::DRAWDOWN;
    std::string symbol;                   // concentration만
    double value = 0.0;                   // %
    double threshold = 0.0;               // %
    std::string message;
};

// In-process service facade: boundary validation on top of the lifecycle,
// portfolio alerts, and backtest/optimization entry points.
class RiskEngine {
public:
    explicit RiskEngine(
        const risk::RegimeConfigTable& configs = risk::RegimeConfigTable::defaults(),
        const analytics::RegimeClassifier& classifier = analytics::RegimeClassifier(),
        const AlertConfig& alerts = AlertConfig(),
        const backtest::BacktestConfig& backtest_config = backtest::BacktestConfig(),
        const backtest::GridSearchSpace& grid = backtest::GridSearchSpace::defaults()
    );
    explicit RiskEngine(const Config& config);

    OpenPositionResult openPosition(
        const std::string& symbol,
        double entry_price,
        const MarketSnapshot& snapshot,
        double position_size_pct = 100.0
    );

    PositionUpdateResult updatePosition(
        const std::string& symbol,
        double high,
        double low,
        double close,
        const MarketSnapshot& snapshot
    );

    std::optional<risk::ClosedTrade> closePosition(const std::string& symbol, double price);

    PortfolioPerformance getPortfolioPerformance() const;

    // configOverrides 없으면 엔진의 레짐 테이블 사용
    backtest::ComparativeReport runBacktest(
        const std::vector<backtest::HistoricalTrade>& trades,
        const std::optional<risk::RegimeConfigTable>& config_overrides = std::nullopt
    ) const;

    backtest::OptimizationResult optimizeParameters(
        const std::vector<backtest::HistoricalTrade>& trades,
        const std::optional<backtest::GridSearchSpace>& grid = std::nullopt
    ) const;

    std::vector<PortfolioAlert> checkPortfolioAlerts() const;

    // VIX 40%, True Range 30%, momentum 30%
    static double calculateRiskScore(const MarketSnapshot& snapshot, double entry_price);

    static RegimeStability assessRegimeStability(double vix);
    static PositionHealth assessPositionHealth(const risk::UpdateResult& result);
    static PreUpdateAnalysis analyzeBeforeUpdate(const risk::TradePosition& position, double close,
                                                 const MarketSnapshot& snapshot);
    // 최근 5건 수익률 합의 부호
    static PerformanceTrend performanceTrend(const std::vector<risk::ClosedTrade>& history);
    static RiskAdjustedMetrics riskAdjustedMetrics(const PerformanceSummary& performance);

    const risk::PositionLifecycle& lifecycle() const { return lifecycle_; }

private:
    void validateBoundary(const MarketSnapshot& snapshot) const;

    risk::RegimeConfigTable configs_;
    analytics::RegimeClassifier classifier_;
    AlertConfig alerts_;
    BoundaryLimits limits_;
    backtest::BacktestConfig backtest_config_;
    backtest::GridSearchSpace grid_;
    risk::PositionLifecycle lifecycle_;
};

} // namespace engine
} // namespace swingrisk
