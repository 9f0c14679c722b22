#include "engine/RiskEngine.h"
#include "common/Config.h"
#include "common/Errors.h"
#include "common/Logger.h"

#include <algorithm>
#include <cmath>

namespace swingrisk {
namespace engine {

namespace {
constexpr double VIX_RISK_CAP = 50.0;
constexpr double TR_RISK_CAP_PCT = 0.05;
constexpr double VIX_WEIGHT = 40.0;
constexpr double TR_WEIGHT = 30.0;
constexpr double MOMENTUM_WEIGHT = 30.0;

constexpr double STABLE_LOW_VOL_VIX = 15.0;
constexpr double STABLE_HIGH_VOL_VIX = 35.0;
constexpr double HEALTHY_PROFIT_PNL = 0.05;
constexpr double AT_RISK_PNL = -0.03;
constexpr double PRE_UPDATE_VIX_DRIFT = 10.0;
constexpr std::size_t TREND_WINDOW = 5;
constexpr double SORTINO_APPROX_FACTOR = 1.1;
constexpr double MIN_LOSS_DENOMINATOR = 0.01;
}

RiskEngine::RiskEngine(
    const risk::RegimeConfigTable& configs,
    const analytics::RegimeClassifier& classifier,
    const AlertConfig& alerts,
    const backtest::BacktestConfig& backtest_config,
    const backtest::GridSearchSpace& grid
)
    : configs_(configs)
    , classifier_(classifier)
    , alerts_(alerts)
    , backtest_config_(backtest_config)
    , grid_(grid)
    , lifecycle_(configs, classifier)
{
    LOG_INFO("RiskEngine initialized (bands {:.1f}/{:.1f}/{:.1f}, drawdown alert {:.1f}%, concentration {:.1f}%)",
             classifier_.bands().bull_normal_min, classifier_.bands().high_vol_min, classifier_.bands().crisis_min,
             alerts_.max_drawdown_pct, alerts_.position_concentration_pct);
}

RiskEngine::RiskEngine(const Config& config)
    : RiskEngine(config.getRegimeConfigs(),
                 analytics::RegimeClassifier(config.getRegimeBands()),
                 config.getAlertConfig(),
                 config.getBacktestConfig(),
                 config.getGridSearchSpace())
{
}

void RiskEngine::validateBoundary(const MarketSnapshot& snapshot) const {
    if (!std::isfinite(snapshot.vix) || snapshot.vix < limits_.min_vix || snapshot.vix > limits_.max_vix) {
        throw InvalidInput("VIX level outside valid range (5-100)");
    }
}

double RiskEngine::calculateRiskScore(const MarketSnapshot& snapshot, double entry_price) {
    if (!std::isfinite(entry_price) || entry_price <= 0.0) {
        throw InvalidInput("entry price must be positive");
    }

    double score = std::min(snapshot.vix / VIX_RISK_CAP, 1.0) * VIX_WEIGHT;

    const double true_range = snapshot.true_range.value_or(entry_price * risk::PositionLifecycle::kDefaultTrueRangePct);
    score += std::min((true_range / entry_price) / TR_RISK_CAP_PCT, 1.0) * TR_WEIGHT;

    const double momentum = snapshot.momentum_ratio.value_or(1.0);
    score += std::fabs(1.0 - momentum) * MOMENTUM_WEIGHT;

    return std::min(score, 100.0);
}

OpenPositionResult RiskEngine::openPosition(
    const std::string& symbol,
    double entry_price,
    const MarketSnapshot& snapshot,
    double position_size_pct
) {
    try {
        validateBoundary(snapshot);
        const risk::OpenResult opened = lifecycle_.open(symbol, entry_price, snapshot, position_size_pct);
        const analytics::RegimeAnalysis analysis = classifier_.analyze(snapshot);

        OpenPositionResult result;
        result.symbol = symbol;
        result.regime = opened.position.regime_at_entry;
        result.regime_confidence = analysis.confidence;
        result.entry_price = entry_price;
        result.position_size_pct = position_size_pct;
        result.stop_level = opened.stop.price;
        result.stop_distance_pct = opened.stop.pct;
        result.stop_method = opened.stop.method;
        result.true_range = opened.true_range;
        result.profit_targets = opened.position.profit_targets;
        result.expected_hold_days = opened.expected_hold_days;
        result.transition_detected = opened.transition_detected;
        result.adjustment_reason = opened.adjustment.reason;
        result.risk_score = calculateRiskScore(snapshot, entry_price);

        for (const auto& alert : checkPortfolioAlerts()) {
            LOG_WARN("Portfolio alert: {}", alert.message);
        }
        return result;
    } catch (const RiskError& e) {
        LOG_ERROR("openPosition {} rejected: {}", symbol, e.what());
        throw;
    }
}

PositionUpdateResult RiskEngine::updatePosition(
    const std::string& symbol,
    double high,
    double low,
    double close,
    const MarketSnapshot& snapshot
) {
    try {
        validateBoundary(snapshot);

        PositionUpdateResult result;
        // 없는 종목은 lifecycle이 PositionNotFound
        if (const auto before = lifecycle_.getPosition(symbol)) {
            result.pre_update = analyzeBeforeUpdate(*before, close, snapshot);
        }
        result.update = lifecycle_.update(symbol, high, low, close, snapshot);
        result.regime_stability = assessRegimeStability(snapshot.vix);
        result.position_health = assessPositionHealth(result.update);

        for (const auto& action : result.update.actions) {
            LOG_INFO("Position action for {}: {} ({})", symbol, risk::actionTypeToString(action.type),
                     positionHealthToString(result.position_health));
        }
        if (result.update.closed_trade) {
            for (const auto& alert : checkPortfolioAlerts()) {
                LOG_WARN("Portfolio alert: {}", alert.message);
            }
        }
        return result;
    } catch (const RiskError& e) {
        LOG_ERROR("updatePosition {} rejected: {}", symbol, e.what());
        throw;
    }
}

std::optional<risk::ClosedTrade> RiskEngine::closePosition(const std::string& symbol, double price) {
    return lifecycle_.closePosition(symbol, price, "manual");
}

PortfolioPerformance RiskEngine::getPortfolioPerformance() const {
    const std::vector<risk::ClosedTrade> history = lifecycle_.getTradeHistory();
    const std::vector<risk::TradePosition> active = lifecycle_.getActivePositions();

    PortfolioPerformance out;
    out.performance = PerformanceAggregator::summarize(history);
    out.active_positions = static_cast<int>(active.size());
    for (const auto& trade : history) {
        out.regime_distribution[trade.regime_at_entry]++;
    }
    for (const auto& pos : active) {
        out.regime_distribution[pos.regime_at_entry]++;
    }
    out.risk_adjusted = riskAdjustedMetrics(out.performance);
    out.trend = performanceTrend(history);
    return out;
}

RegimeStability RiskEngine::assessRegimeStability(double vix) {
    if (vix < STABLE_LOW_VOL_VIX) {
        return RegimeStability::STABLE_LOW_VOL;
    }
    if (vix > STABLE_HIGH_VOL_VIX) {
        return RegimeStability::STABLE_HIGH_VOL;
    }
    return RegimeStability::TRANSITIONAL;
}

PositionHealth RiskEngine::assessPositionHealth(const risk::UpdateResult& result) {
    if (result.status == risk::PositionState::CLOSED) {
        return PositionHealth::CLOSED;
    }
    const double pnl = result.current_pnl.value_or(0.0);
    if (pnl > HEALTHY_PROFIT_PNL) {
        return PositionHealth::HEALTHY_PROFIT;
    }
    if (pnl < AT_RISK_PNL) {
        return PositionHealth::AT_RISK;
    }
    return PositionHealth::NEUTRAL;
}

PreUpdateAnalysis RiskEngine::analyzeBeforeUpdate(
    const risk::TradePosition& position,
    double close,
    const MarketSnapshot& snapshot
) {
    if (!std::isfinite(close) || close <= 0.0) {
        throw InvalidInput(position.symbol + " daily prices must be positive");
    }

    PreUpdateAnalysis analysis;
    analysis.current_pnl_pct = (close - position.entry_price) / position.entry_price * 100.0;
    analysis.days_held = position.days_held;
    analysis.stop_distance = std::fabs(position.stop_level - close) / close;
    analysis.regime_change_detected = std::fabs(snapshot.vix - position.vix_at_entry) > PRE_UPDATE_VIX_DRIFT;
    return analysis;
}

PerformanceTrend RiskEngine::performanceTrend(const std::vector<risk::ClosedTrade>& history) {
    if (history.size() < TREND_WINDOW) {
        return PerformanceTrend::INSUFFICIENT_DATA;
    }
    double recent = 0.0;
    for (auto it = history.end() - static_cast<std::ptrdiff_t>(TREND_WINDOW); it != history.end(); ++it) {
        recent += it->realized_return;
    }
    return (recent > 0.0) ? PerformanceTrend::POSITIVE : PerformanceTrend::NEGATIVE;
}

RiskAdjustedMetrics RiskEngine::riskAdjustedMetrics(const PerformanceSummary& performance) {
    RiskAdjustedMetrics metrics;
    metrics.sortino_ratio = performance.sharpe_ratio * SORTINO_APPROX_FACTOR;
    metrics.win_loss_ratio =
        std::fabs(performance.max_win) / std::max(std::fabs(performance.max_loss), MIN_LOSS_DENOMINATOR);
    return metrics;
}

backtest::ComparativeReport RiskEngine::runBacktest(
    const std::vector<backtest::HistoricalTrade>& trades,
    const std::optional<risk::RegimeConfigTable>& config_overrides
) const {
    const backtest::MultiLayerBacktester backtester(
        config_overrides ? *config_overrides : configs_, classifier_, backtest_config_);
    return backtester.run(trades);
}

backtest::OptimizationResult RiskEngine::optimizeParameters(
    const std::vector<backtest::HistoricalTrade>& trades,
    const std::optional<backtest::GridSearchSpace>& grid
) const {
    const backtest::MultiLayerBacktester backtester(configs_, classifier_, backtest_config_);
    return backtester.optimize(trades, grid ? *grid : grid_);
}

std::vector<PortfolioAlert> RiskEngine::checkPortfolioAlerts() const {
    std::vector<PortfolioAlert> alerts;

    const PerformanceSummary perf = PerformanceAggregator::summarize(lifecycle_.getTradeHistory());
    const double drawdown_pct = perf.current_drawdown * 100.0;
    if (drawdown_pct < alerts_.max_drawdown_pct) {
        PortfolioAlert alert;
        alert.type = AlertType::DRAWDOWN;
        alert.value = drawdown_pct;
        alert.threshold = alerts_.max_drawdown_pct;
        alert.message = fmt::format("Portfolio drawdown ({:.1f}%) exceeds threshold ({:.1f}%)",
                                    drawdown_pct, alerts_.max_drawdown_pct);
        alerts.push_back(alert);
    }

    for (const auto& pos : lifecycle_.getActivePositions()) {
        if (pos.position_size_pct > alerts_.position_concentration_pct) {
            PortfolioAlert alert;
            alert.type = AlertType::CONCENTRATION;
            alert.symbol = pos.symbol;
            alert.value = pos.position_size_pct;
            alert.threshold = alerts_.position_concentration_pct;
            alert.message = fmt::format("Position concentration {} ({:.1f}%) exceeds limit ({:.1f}%)",
                                        pos.symbol, pos.position_size_pct, alerts_.position_concentration_pct);
            alerts.push_back(alert);
        }
    }
    return alerts;
}

} // namespace engine
} // namespace swingrisk
