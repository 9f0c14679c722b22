#include "analytics/TechnicalIndicators.h"
#include "common/Errors.h"
#include "risk/AdaptiveStopEngine.h"
#include "risk/RegimeConfig.h"
#include <cassert>
#include <cmath>
#include <iostream>

using namespace swingrisk;
using risk::AdaptiveStopEngine;
using risk::RegimeConfigTable;

namespace {
bool approx(double a, double b, double eps = 1e-6) {
    return std::fabs(a - b) < eps;
}

void testPercentageStopWins() {
    AdaptiveStopEngine engine;
    const auto& bull = RegimeConfigTable::defaults().at(RegimeType::BULL_NORMAL);

    // TR 2% of entry -> trPct -3.6% loses to -8%
    auto stop = engine.calculate(45.66, bull, 45.66 * 0.02);
    assert(approx(stop.pct, -8.0));
    assert(approx(stop.price, 42.0072));
    assert(stop.method == "pct_based");
}

void testTrueRangeStopWins() {
    AdaptiveStopEngine engine;
    const auto& bull = RegimeConfigTable::defaults().at(RegimeType::BULL_NORMAL);

    auto stop = engine.calculate(100.0, bull, 6.0);
    assert(approx(stop.pct, -10.8));
    assert(approx(stop.price, 89.2));
    assert(stop.method == "tr_based");
}

void testBreadthAdjustment() {
    AdaptiveStopEngine engine;
    const auto& bull = RegimeConfigTable::defaults().at(RegimeType::BULL_NORMAL);

    assert(approx(engine.calculate(100.0, bull, 1.0, 10.0).pct, -6.4));
    assert(approx(engine.calculate(100.0, bull, 1.0, 70.0).pct, -9.6));
    assert(approx(engine.calculate(100.0, bull, 1.0, 40.0).pct, -8.0));
}

void testHardBounds() {
    AdaptiveStopEngine engine;
    const auto& crisis = RegimeConfigTable::defaults().at(RegimeType::CRISIS_OPPORTUNITY);

    auto wide = engine.calculate(100.0, crisis, 20.0);
    assert(approx(wide.pct, -25.0));
    assert(approx(wide.price, 75.0));

    risk::RegimeConfig tight = RegimeConfigTable::defaults().at(RegimeType::LOW_VOL_COMPLACENCY);
    tight.stop_loss_pct = -2.2;
    tight.tr_stop_multiplier = 0.1;
    auto narrow = engine.calculate(100.0, tight, 1.0, 10.0);
    assert(approx(narrow.pct, -2.0));
    assert(approx(narrow.price, 98.0));

    // 모든 레짐/TR 조합에서 [-25, -2]
    for (RegimeType regime : kAllRegimes) {
        const auto& cfg = RegimeConfigTable::defaults().at(regime);
        for (double tr : {0.01, 0.5, 2.0, 8.0, 40.0}) {
            for (double t2108 : {5.0, 50.0, 95.0}) {
                auto s = engine.calculate(50.0, cfg, tr, t2108, 1.7);
                assert(s.pct >= AdaptiveStopEngine::kWidestStopPct - 1e-12);
                assert(s.pct <= AdaptiveStopEngine::kTightestStopPct + 1e-12);
                assert(s.price < 50.0);
            }
        }
    }
}

void testInvalidInput() {
    AdaptiveStopEngine engine;
    const auto& bull = RegimeConfigTable::defaults().at(RegimeType::BULL_NORMAL);

    bool threw = false;
    try {
        engine.calculate(0.0, bull, 1.0);
    } catch (const InvalidInput&) {
        threw = true;
    }
    assert(threw);

    threw = false;
    try {
        engine.calculate(100.0, bull, 0.0);
    } catch (const InvalidInput&) {
        threw = true;
    }
    assert(threw);
}

void testVolatilityNormalization() {
    AdaptiveStopEngine engine;
    const auto& bull = RegimeConfigTable::defaults().at(RegimeType::BULL_NORMAL);
    analytics::TrueRangeHistory history;

    // 이력 없으면 factor 1.0
    assert(approx(history.volatilityFactor("XYZ", 3.0), 1.0));

    history.record("XYZ", 1.0);
    history.record("XYZ", 1.0);
    // 현재 TR 포함 평균: (1 + 1 + 3) / 3
    auto stop = engine.calculate(100.0, bull, 3.0, std::nullopt, history, "XYZ");
    assert(approx(stop.volatility_factor, 1.8));
    assert(approx(stop.pct, -9.72));
    assert(stop.method == "tr_based");

    // 1 -> 4: mean(1, 4) = 2.5, factor 1.6, stop -(4 * 1.8 * 1.6)%
    analytics::TrueRangeHistory spike;
    spike.record("AAPL", 1.0);
    auto widened = engine.calculate(100.0, bull, 4.0, std::nullopt, spike, "AAPL");
    assert(approx(widened.volatility_factor, 1.6));
    assert(approx(widened.pct, -11.52));

    // Window keeps the last kWindow observations
    for (int i = 0; i < 10; ++i) {
        history.record("XYZ", 2.0);
    }
    assert(history.observations("XYZ").size() == analytics::TrueRangeHistory::kWindow);
    assert(approx(history.volatilityFactor("XYZ", 2.0), 1.0));

    history.clear("XYZ");
    assert(history.observations("XYZ").empty());
}

void testTrueRange() {
    using analytics::TechnicalIndicators;
    assert(approx(TechnicalIndicators::calculateTrueRange(105.0, 100.0, 102.0), 5.0));
    assert(approx(TechnicalIndicators::calculateTrueRange(105.0, 101.0, 95.0), 10.0));
    assert(approx(TechnicalIndicators::calculateTrueRange(99.0, 96.0, 104.0), 8.0));

    std::vector<DailyBar> bars = {DailyBar(10.0, 9.0, 9.5), DailyBar(11.0, 10.0, 10.5)};
    auto trs = TechnicalIndicators::calculateTrueRanges(bars);
    assert(trs.size() == 2);
    assert(approx(trs[0], 1.0));
    assert(approx(trs[1], 1.5));
}
}

int main() {
    std::cout << "[TEST] Starting AdaptiveStopEngine Test..." << std::endl;

    testPercentageStopWins();
    testTrueRangeStopWins();
    testBreadthAdjustment();
    testHardBounds();
    testInvalidInput();
    testVolatilityNormalization();
    testTrueRange();

    std::cout << "[TEST] AdaptiveStopEngine Test PASSED!" << std::endl;
    return 0;
}
