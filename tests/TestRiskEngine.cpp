#include "engine/RiskEngine.h"
#include "common/Errors.h"
#include "core/report/ReportSchema.h"
#include <cassert>
#include <cmath>
#include <iostream>
#include <string>

using namespace swingrisk;
using engine::AlertType;
using engine::PerformanceTrend;
using engine::PositionHealth;
using engine::RegimeStability;
using engine::RiskEngine;

namespace {
bool approx(double a, double b, double eps = 1e-9) {
    return std::fabs(a - b) < eps;
}

template<typename E, typename F>
bool throwsError(F&& fn) {
    try {
        fn();
    } catch (const E&) {
        return true;
    }
    return false;
}

void testBoundaryValidation() {
    RiskEngine risk_engine;
    assert(throwsError<InvalidInput>([&] { risk_engine.openPosition("LOW", 100.0, MarketSnapshot(3.0), 10.0); }));
    assert(throwsError<InvalidInput>([&] { risk_engine.openPosition("HIGH", 100.0, MarketSnapshot(120.0), 10.0); }));
    assert(risk_engine.lifecycle().getActivePositions().empty());

    risk_engine.openPosition("OK", 100.0, MarketSnapshot(20.0), 10.0);
    assert(throwsError<InvalidInput>([&] {
        risk_engine.updatePosition("OK", 101.0, 99.0, 100.0, MarketSnapshot(150.0));
    }));
    assert(throwsError<DuplicatePosition>([&] { risk_engine.openPosition("OK", 101.0, MarketSnapshot(20.0), 10.0); }));
    assert(throwsError<PositionNotFound>([&] {
        risk_engine.updatePosition("NONE", 101.0, 99.0, 100.0, MarketSnapshot(20.0));
    }));
}

void testOpenPosition() {
    RiskEngine risk_engine;
    auto opened = risk_engine.openPosition("AAPL", 45.66, MarketSnapshot(15.43), 10.0);

    assert(opened.regime == RegimeType::BULL_NORMAL);
    assert(approx(opened.regime_confidence, 0.7));
    assert(approx(opened.stop_distance_pct, -8.0));
    assert(approx(opened.stop_level, 45.66 * 0.92));
    assert(approx(opened.true_range, 45.66 * 0.02));
    assert(opened.profit_targets.size() == 3);
    assert(opened.expected_hold_days == 3);
    assert(!opened.transition_detected);
    // 12.344 (VIX) + 12 (TR 2%) + 0 (momentum)
    assert(approx(opened.risk_score, 24.344));
}

void testRiskScore() {
    MarketSnapshot calm(10.0);
    assert(approx(RiskEngine::calculateRiskScore(calm, 100.0), 8.0 + 12.0));

    MarketSnapshot stressed(80.0);
    stressed.true_range = 10.0;
    stressed.momentum_ratio = 0.2;
    assert(approx(RiskEngine::calculateRiskScore(stressed, 100.0), 40.0 + 30.0 + 24.0));

    MarketSnapshot extreme(90.0);
    extreme.true_range = 20.0;
    extreme.momentum_ratio = 3.0;
    assert(approx(RiskEngine::calculateRiskScore(extreme, 100.0), 100.0));

    assert(throwsError<InvalidInput>([] { RiskEngine::calculateRiskScore(MarketSnapshot(20.0), 0.0); }));
}

void testConcentrationAlert() {
    RiskEngine risk_engine;
    risk_engine.openPosition("SMALL", 50.0, MarketSnapshot(20.0), 20.0);
    assert(risk_engine.checkPortfolioAlerts().empty());

    risk_engine.openPosition("BIG", 50.0, MarketSnapshot(20.0), 100.0);
    auto alerts = risk_engine.checkPortfolioAlerts();
    assert(alerts.size() == 1);
    assert(alerts[0].type == AlertType::CONCENTRATION);
    assert(alerts[0].symbol == "BIG");
    assert(approx(alerts[0].value, 100.0));
    assert(approx(alerts[0].threshold, 25.0));
    assert(!alerts[0].message.empty());
}

void testDrawdownAlertAndPerformance() {
    RiskEngine risk_engine;
    risk_engine.openPosition("A", 100.0, MarketSnapshot(20.0), 10.0);
    auto first = risk_engine.closePosition("A", 110.0);
    assert(first && first->exit_reason == "manual");
    assert(risk_engine.checkPortfolioAlerts().empty());

    risk_engine.openPosition("B", 100.0, MarketSnapshot(20.0), 10.0);
    auto second = risk_engine.closePosition("B", 80.0);
    assert(second && approx(second->realized_return, -0.20));
    assert(!risk_engine.closePosition("B", 80.0));

    // Equity 1.10 -> 0.88
    auto alerts = risk_engine.checkPortfolioAlerts();
    assert(alerts.size() == 1);
    assert(alerts[0].type == AlertType::DRAWDOWN);
    assert(approx(alerts[0].value, -20.0));
    assert(approx(alerts[0].threshold, -15.0));

    auto portfolio = risk_engine.getPortfolioPerformance();
    assert(portfolio.active_positions == 0);
    assert(portfolio.performance.total_trades == 2);
    assert(approx(portfolio.performance.total_return, -0.10));
    assert(approx(portfolio.performance.win_rate, 0.5));
    assert(portfolio.performance.by_regime.at(RegimeType::BULL_NORMAL).trades == 2);
}

void testUpdateThroughFacade() {
    RiskEngine risk_engine;
    risk_engine.openPosition("KO", 100.0, MarketSnapshot(20.0), 10.0);
    auto result = risk_engine.updatePosition("KO", 101.0, 91.0, 92.5, MarketSnapshot(20.0));
    assert(result.update.status == risk::PositionState::CLOSED);
    assert(result.update.closed_trade);
    assert(result.update.closed_trade->exit_reason == "stop_loss");
    assert(approx(result.update.closed_trade->realized_return, -0.08));
    assert(result.position_health == PositionHealth::CLOSED);
    assert(result.regime_stability == RegimeStability::TRANSITIONAL);

    // 업데이트 직전 상태 기준
    assert(approx(result.pre_update.current_pnl_pct, -7.5));
    assert(result.pre_update.days_held == 0);
    assert(approx(result.pre_update.stop_distance, 0.5 / 92.5));
    assert(!result.pre_update.regime_change_detected);
    assert(risk_engine.getPortfolioPerformance().active_positions == 0);

    auto j = core::report::toJson(result);
    assert(j["status"] == "CLOSED");
    assert(j["position_health"] == "closed");
    assert(j["regime_stability"] == "transitional");
    assert(j["pre_update_analysis"]["days_held"] == 0);
}

void testPositionHealth() {
    RiskEngine risk_engine;
    risk_engine.openPosition("HP", 100.0, MarketSnapshot(20.0), 10.0);
    risk_engine.openPosition("AR", 100.0, MarketSnapshot(20.0), 10.0);
    risk_engine.openPosition("NT", 100.0, MarketSnapshot(20.0), 10.0);

    // VIX drift 12: flagged, below the readjustment threshold
    auto healthy = risk_engine.updatePosition("HP", 107.0, 99.0, 106.0, MarketSnapshot(32.0));
    assert(healthy.update.actions.empty());
    assert(healthy.position_health == PositionHealth::HEALTHY_PROFIT);
    assert(healthy.pre_update.regime_change_detected);
    assert(healthy.regime_stability == RegimeStability::TRANSITIONAL);

    auto at_risk = risk_engine.updatePosition("AR", 100.0, 95.0, 96.0, MarketSnapshot(12.0));
    assert(at_risk.position_health == PositionHealth::AT_RISK);
    assert(at_risk.regime_stability == RegimeStability::STABLE_LOW_VOL);
    assert(approx(at_risk.pre_update.stop_distance, 4.0 / 96.0));
    assert(!at_risk.pre_update.regime_change_detected);

    auto neutral = risk_engine.updatePosition("NT", 101.0, 99.0, 100.0, MarketSnapshot(40.0));
    assert(neutral.update.status == risk::PositionState::ACTIVE);
    assert(neutral.position_health == PositionHealth::NEUTRAL);
    assert(neutral.regime_stability == RegimeStability::STABLE_HIGH_VOL);

    // 경계값은 transitional
    assert(RiskEngine::assessRegimeStability(15.0) == RegimeStability::TRANSITIONAL);
    assert(RiskEngine::assessRegimeStability(35.0) == RegimeStability::TRANSITIONAL);
    assert(RiskEngine::assessRegimeStability(14.9) == RegimeStability::STABLE_LOW_VOL);
}

void testPortfolioAnalytics() {
    RiskEngine risk_engine;
    const double exits[] = {110.0, 80.0, 105.0, 103.0};
    int n = 0;
    for (double exit_price : exits) {
        const std::string symbol = "T" + std::to_string(n++);
        risk_engine.openPosition(symbol, 100.0, MarketSnapshot(20.0), 10.0);
        risk_engine.closePosition(symbol, exit_price);
    }
    assert(risk_engine.getPortfolioPerformance().trend == PerformanceTrend::INSUFFICIENT_DATA);

    risk_engine.openPosition("T4", 100.0, MarketSnapshot(20.0), 10.0);
    risk_engine.closePosition("T4", 104.0);
    risk_engine.openPosition("OPEN", 100.0, MarketSnapshot(40.0), 10.0);

    auto portfolio = risk_engine.getPortfolioPerformance();
    // 0.10 - 0.20 + 0.05 + 0.03 + 0.04 > 0
    assert(portfolio.trend == PerformanceTrend::POSITIVE);
    assert(portfolio.active_positions == 1);
    assert(portfolio.regime_distribution.at(RegimeType::BULL_NORMAL) == 5);
    assert(portfolio.regime_distribution.at(RegimeType::HIGH_VOL_STRESS) == 1);
    assert(approx(portfolio.risk_adjusted.win_loss_ratio, 0.10 / 0.20));
    assert(approx(portfolio.risk_adjusted.sortino_ratio, portfolio.performance.sharpe_ratio * 1.1));

    risk_engine.openPosition("T5", 100.0, MarketSnapshot(20.0), 10.0);
    risk_engine.closePosition("T5", 70.0);
    assert(risk_engine.getPortfolioPerformance().trend == PerformanceTrend::NEGATIVE);

    auto j = core::report::toJson(risk_engine.getPortfolioPerformance());
    assert(j["performance_trend"] == "negative_trend");
    assert(j["regime_distribution"]["bull_normal"] == 6);
    assert(j["risk_adjusted_metrics"].contains("sortino_ratio"));

    // max loss floor 1%
    engine::PerformanceSummary winners_only;
    winners_only.max_win = 0.05;
    winners_only.max_loss = 0.0;
    assert(approx(RiskEngine::riskAdjustedMetrics(winners_only).win_loss_ratio, 5.0));
}

backtest::HistoricalTrade stopTrade() {
    backtest::HistoricalTrade t;
    t.symbol = "BT";
    t.entry_price = 100.0;
    t.vix_at_entry = 20.0;
    t.true_range = 2.0;
    t.bars = {DailyBar(101.0, 90.0, 91.0), DailyBar(97.0, 93.0, 96.0)};
    return t;
}

void testBacktestOverrides() {
    RiskEngine risk_engine;
    auto report = risk_engine.runBacktest({stopTrade()});
    assert(approx(report.layer(backtest::BacktestLayer::STOP_ONLY).performance.total_return, -0.08));

    // 손절 -5%로 재정의
    auto overrides = risk::RegimeConfigTable::defaults();
    auto bull = overrides.at(RegimeType::BULL_NORMAL);
    bull.stop_loss_pct = -5.0;
    overrides.set(RegimeType::BULL_NORMAL, bull);
    auto overridden = risk_engine.runBacktest({stopTrade()}, overrides);
    assert(approx(overridden.layer(backtest::BacktestLayer::STOP_ONLY).performance.total_return, -0.05));

    backtest::GridSearchSpace grid;
    grid.vix_bands = {analytics::RegimeBands{15.0, 30.0, 50.0}};
    grid.stop_scalars = {1.0};
    grid.profit_scalars = {1.0};
    auto optimized = risk_engine.optimizeParameters({stopTrade()}, grid);
    assert(optimized.found);
    assert(optimized.evaluated.size() == 1);
}
}

int main() {
    std::cout << "[TEST] Starting RiskEngine Test..." << std::endl;

    testBoundaryValidation();
    testOpenPosition();
    testRiskScore();
    testConcentrationAlert();
    testDrawdownAlertAndPerformance();
    testUpdateThroughFacade();
    testPositionHealth();
    testPortfolioAnalytics();
    testBacktestOverrides();

    std::cout << "[TEST] RiskEngine Test PASSED!" << std::endl;
    return 0;
}
