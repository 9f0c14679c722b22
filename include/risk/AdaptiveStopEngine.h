#pragma once

#include "analytics/TechnicalIndicators.h"
#include "risk/RegimeConfig.h"
#include <optional>
#include <string>

namespace swingrisk {
namespace risk {

struct StopLevel {
    double price = 0.0;
    double pct = 0.0;                 // 진입가 대비 (%), 항상 [-25, -2]
    std::string method;               // "tr_based" | "pct_based"
    double volatility_factor = 1.0;
};

// Percentage stop vs. volatility-normalized True Range stop, whichever is wider,
// then breadth adjustment and the hard [-25%, -2%] clamp.
class AdaptiveStopEngine {
public:
    static constexpr double kWidestStopPct = -25.0;
    static constexpr double kTightestStopPct = -2.0;

    StopLevel calculate(
        double entry_price,
        const RegimeConfig& config,
        double current_true_range,
        std::optional<double> t2108 = std::nullopt,
        double volatility_factor = 1.0
    ) const;

    // Volatility factor taken from the symbol's rolling True Range window
    StopLevel calculate(
        double entry_price,
        const RegimeConfig& config,
        double current_true_range,
        std::optional<double> t2108,
        const analytics::TrueRangeHistory& history,
        const std::string& symbol
    ) const;

    static double clampStopPct(double pct);
};

} // namespace risk
} // namespace swingrisk
