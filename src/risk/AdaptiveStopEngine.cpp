#include "risk/AdaptiveStopEngine.h"
#include "common/Errors.h"
#include <algorithm>
#include <cmath>

namespace swingrisk {
namespace risk {

namespace {
constexpr double WEAK_BREADTH_T2108 = 20.0;
constexpr double STRONG_BREADTH_T2108 = 60.0;
constexpr double WEAK_BREADTH_FACTOR = 0.8;    // 손절 좁힘
constexpr double STRONG_BREADTH_FACTOR = 1.2;  // 손절 넓힘
} // namespace

double AdaptiveStopEngine::clampStopPct(double pct) {
    return std::clamp(pct, kWidestStopPct, kTightestStopPct);
}

StopLevel AdaptiveStopEngine::calculate(
    double entry_price,
    const RegimeConfig& config,
    double current_true_range,
    std::optional<double> t2108,
    double volatility_factor
) const {
    if (!std::isfinite(entry_price) || entry_price <= 0.0) {
        throw InvalidInput("entry price must be positive");
    }
    if (!std::isfinite(current_true_range) || current_true_range <= 0.0) {
        throw InvalidInput("true range must be positive");
    }
    if (!std::isfinite(volatility_factor) || volatility_factor <= 0.0) {
        volatility_factor = 1.0;
    }

    // 1. Percentage stop
    const double base_pct = config.stop_loss_pct;

    // 2. Volatility stop
    const double tr_pct =
        -(current_true_range * config.tr_stop_multiplier * volatility_factor / entry_price) * 100.0;

    // 3. More conservative (further from entry)
    double final_pct = std::min(base_pct, tr_pct);

    // 4. Market breadth
    if (t2108) {
        if (*t2108 < WEAK_BREADTH_T2108) {
            final_pct *= WEAK_BREADTH_FACTOR;
        } else if (*t2108 > STRONG_BREADTH_T2108) {
            final_pct *= STRONG_BREADTH_FACTOR;
        }
    }

    // 5. Hard bounds, always last
    final_pct = clampStopPct(final_pct);

    StopLevel result;
    result.pct = final_pct;
    result.price = entry_price * (1.0 + final_pct / 100.0);
    result.method = (tr_pct < base_pct) ? "tr_based" : "pct_based";
    result.volatility_factor = volatility_factor;
    return result;
}

StopLevel AdaptiveStopEngine::calculate(
    double entry_price,
    const RegimeConfig& config,
    double current_true_range,
    std::optional<double> t2108,
    const analytics::TrueRangeHistory& history,
    const std::string& symbol
) const {
    const double factor = history.volatilityFactor(symbol, current_true_range);
    return calculate(entry_price, config, current_true_range, t2108, factor);
}

} // namespace risk
} // namespace swingrisk
