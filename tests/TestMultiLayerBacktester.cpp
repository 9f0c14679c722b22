#include "backtest/MultiLayerBacktester.h"
#include "common/Errors.h"
#include <cassert>
#include <cmath>
#include <iostream>
#include <set>

using namespace swingrisk;
using backtest::BacktestConfig;
using backtest::BacktestLayer;
using backtest::HistoricalTrade;
using backtest::MultiLayerBacktester;

namespace {
bool approx(double a, double b, double eps = 1e-6) {
    return std::fabs(a - b) < eps;
}

// Stops out on day 1 (stop 92), otherwise drifts to 96
HistoricalTrade loser() {
    HistoricalTrade t;
    t.symbol = "AAA";
    t.entry_price = 100.0;
    t.vix_at_entry = 20.0;
    t.true_range = 2.0;
    t.bars = {DailyBar(101.0, 90.0, 91.0), DailyBar(95.0, 89.0, 94.0), DailyBar(97.0, 93.0, 96.0)};
    return t;
}

// Walks through all three targets (56 / 62.5 / 70)
HistoricalTrade winner() {
    HistoricalTrade t;
    t.symbol = "BBB";
    t.entry_price = 50.0;
    t.vix_at_entry = 20.0;
    t.true_range = 1.0;
    t.bars = {DailyBar(56.5, 49.5, 56.0), DailyBar(63.0, 55.0, 62.6), DailyBar(70.5, 62.0, 70.0)};
    return t;
}

void testLayers() {
    MultiLayerBacktester backtester;
    auto report = backtester.run({loser(), winner()});

    assert(report.trade_count == 2);
    assert(report.layers.size() == 4);

    const auto& baseline = report.layer(BacktestLayer::BASELINE);
    assert(baseline.exit_reason_counts.at("end_of_data") == 2);
    assert(approx(baseline.performance.total_return, -0.04 + 0.40));

    const auto& stop_only = report.layer(BacktestLayer::STOP_ONLY);
    assert(stop_only.exit_reason_counts.at("stop_loss") == 1);
    // 발동하지 않은 거래는 baseline처럼 데이터 끝에서 청산
    assert(stop_only.exit_reason_counts.at("end_of_data") == 1);
    assert(approx(stop_only.performance.total_return, -0.08 + 0.40));
    assert(approx(stop_only.incremental_return, -0.04));

    const auto& profit_only = report.layer(BacktestLayer::PROFIT_ONLY);
    assert(profit_only.exit_reason_counts.at("profit_taking") == 1);
    assert(approx(profit_only.performance.total_return, -0.04 + 0.2925));

    const auto& combined = report.layer(BacktestLayer::COMBINED);
    assert(approx(combined.performance.total_return, -0.08 + 0.2925));
    assert(approx(combined.incremental_return, combined.performance.total_return - baseline.performance.total_return));
    assert(approx(baseline.incremental_return, 0.0));

    // 모든 거래에 정의된 청산
    const std::set<std::string> reasons = {"stop_loss", "profit_taking", "time_exit", "end_of_data"};
    for (const auto& layer : report.layers) {
        assert(layer.trades.size() == 2);
        for (const auto& trade : layer.trades) {
            assert(reasons.count(trade.exit_reason) == 1);
            assert(trade.exit_price > 0.0);
        }
    }

    assert(report.ranking.size() == 4);
    std::set<BacktestLayer> unique(report.ranking.begin(), report.ranking.end());
    assert(unique.size() == 4);
    for (std::size_t i = 1; i < report.ranking.size(); ++i) {
        assert(report.layer(report.ranking[i - 1]).composite_score >=
               report.layer(report.ranking[i]).composite_score);
    }
}

// Never touches the stop (92) or the first target (112)
HistoricalTrade drifter() {
    HistoricalTrade t;
    t.symbol = "CCC";
    t.entry_price = 100.0;
    t.vix_at_entry = 20.0;
    t.true_range = 2.0;
    t.bars = {DailyBar(101.0, 100.0, 100.5), DailyBar(101.5, 100.0, 101.0), DailyBar(101.0, 98.5, 99.0),
              DailyBar(103.5, 99.0, 103.0), DailyBar(106.5, 102.0, 106.0)};
    return t;
}

void testNonFiringLayersMatchBaseline() {
    MultiLayerBacktester backtester;
    auto report = backtester.run({drifter()});

    for (const auto& layer : report.layers) {
        assert(layer.trades.size() == 1);
        assert(layer.trades[0].days_held == 5);
        assert(layer.trades[0].exit_reason == "time_exit");
        assert(approx(layer.trades[0].realized_return, 0.06));
        assert(approx(layer.incremental_return, 0.0));
        assert(approx(layer.drawdown_reduction, 0.0));
    }
}

void testLayerRules() {
    for (BacktestLayer layer : {BacktestLayer::BASELINE, BacktestLayer::STOP_ONLY,
                                BacktestLayer::PROFIT_ONLY, BacktestLayer::COMBINED}) {
        auto rules = MultiLayerBacktester::rulesFor(layer, 7);
        assert(rules.fixed_hold_days && *rules.fixed_hold_days == 7);
        assert(!rules.log_trades);
    }
    auto stop_only = MultiLayerBacktester::rulesFor(BacktestLayer::STOP_ONLY, 5);
    assert(stop_only.stop_loss && !stop_only.profit_taking && !stop_only.regime_adjustment);
    auto combined = MultiLayerBacktester::rulesFor(BacktestLayer::COMBINED, 5);
    assert(combined.stop_loss && combined.profit_taking && combined.regime_adjustment);

    // 실거래 라이프사이클은 기본적으로 기록
    assert(risk::RuleSet::all().log_trades);
}

void testBaselineHorizon() {
    BacktestConfig config;
    config.baseline_hold_days = 2;
    MultiLayerBacktester backtester(risk::RegimeConfigTable::defaults(), analytics::RegimeClassifier(), config);

    auto layer = backtester.runLayer(BacktestLayer::BASELINE, {loser()});
    assert(layer.trades.size() == 1);
    assert(layer.trades[0].exit_reason == "time_exit");
    assert(layer.trades[0].days_held == 2);
    assert(approx(layer.trades[0].realized_return, -0.06));
}

void testPassIsolation() {
    MultiLayerBacktester backtester;
    const std::vector<HistoricalTrade> trades = {loser(), winner(), loser()};

    auto combined = backtester.runLayer(BacktestLayer::COMBINED, trades);
    auto report = backtester.run(trades);
    assert(approx(combined.performance.total_return,
                  report.layer(BacktestLayer::COMBINED).performance.total_return));
    assert(combined.trades.size() == 3);
}

void testCompositeScore() {
    engine::PerformanceSummary p;
    p.annualized_roi = 5.0;
    p.max_drawdown = -0.10;
    p.sharpe_ratio = 2.0;
    assert(approx(MultiLayerBacktester::compositeScore(p), 100.0));

    p.sharpe_ratio = 0.0;
    assert(approx(MultiLayerBacktester::compositeScore(p), 5.0));

    p.sharpe_ratio = 2.0;
    p.max_drawdown = 0.0;
    assert(approx(MultiLayerBacktester::compositeScore(p), 5.0));
}

void testValidation() {
    MultiLayerBacktester backtester;

    auto bad_entry = loser();
    bad_entry.entry_price = 0.0;
    auto no_bars = loser();
    no_bars.bars.clear();
    auto inverted = loser();
    inverted.bars[1] = DailyBar(90.0, 95.0, 92.0);

    for (const auto& bad : {bad_entry, no_bars, inverted}) {
        bool threw = false;
        try {
            backtester.run({winner(), bad});
        } catch (const InvalidInput&) {
            threw = true;
        }
        assert(threw);
    }

    bool threw = false;
    try {
        BacktestConfig config;
        config.baseline_hold_days = 0;
        MultiLayerBacktester invalid(risk::RegimeConfigTable::defaults(), analytics::RegimeClassifier(), config);
    } catch (const ConfigError&) {
        threw = true;
    }
    assert(threw);
}

void testGridSearch() {
    backtest::GridSearchSpace space;
    space.vix_bands = {analytics::RegimeBands{15.0, 30.0, 50.0}, analytics::RegimeBands{30.0, 20.0, 50.0}};
    space.stop_scalars = {1.0, 1.2};
    space.profit_scalars = {1.0, 0.9};

    const std::vector<HistoricalTrade> trades = {loser(), winner()};

    BacktestConfig parallel;
    parallel.workers = 3;
    MultiLayerBacktester backtester(risk::RegimeConfigTable::defaults(), analytics::RegimeClassifier(), parallel);
    auto result = backtester.optimize(trades, space);

    assert(result.found);
    assert(result.skipped_candidates == 4);
    assert(result.evaluated.size() == 4);
    for (const auto& score : result.evaluated) {
        assert(score.composite_score <= result.best.composite_score);
        assert(score.candidate.bands.isValid());
    }
    // Candidate order preserved
    assert(approx(result.evaluated[0].candidate.stop_scalar, 1.0));
    assert(approx(result.evaluated[0].candidate.profit_scalar, 1.0));
    assert(approx(result.evaluated[1].candidate.profit_scalar, 0.9));

    // Identical candidate 1.0/1.0 matches the plain combined pass
    auto combined = backtester.runLayer(BacktestLayer::COMBINED, trades);
    assert(approx(result.evaluated[0].composite_score, combined.composite_score));

    BacktestConfig serial;
    serial.workers = 1;
    MultiLayerBacktester single(risk::RegimeConfigTable::defaults(), analytics::RegimeClassifier(), serial);
    auto serial_result = single.optimize(trades, space);
    assert(approx(serial_result.best.composite_score, result.best.composite_score));
    assert(approx(serial_result.best.candidate.stop_scalar, result.best.candidate.stop_scalar));
    assert(approx(serial_result.best.candidate.profit_scalar, result.best.candidate.profit_scalar));

    backtest::GridSearchSpace empty;
    empty.vix_bands = {analytics::RegimeBands{30.0, 20.0, 50.0}};
    empty.stop_scalars = {1.0};
    empty.profit_scalars = {1.0};
    auto none = backtester.optimize(trades, empty);
    assert(!none.found);
    assert(none.skipped_candidates == 1);
}
}

int main() {
    std::cout << "[TEST] Starting MultiLayerBacktester Test..." << std::endl;

    testLayers();
    testBaselineHorizon();
    testNonFiringLayersMatchBaseline();
    testLayerRules();
    testPassIsolation();
    testCompositeScore();
    testValidation();
    testGridSearch();

    std::cout << "[TEST] MultiLayerBacktester Test PASSED!" << std::endl;
    return 0;
}
