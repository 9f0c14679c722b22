#include "risk/ProfitLadderEngine.h"
#include "common/Errors.h"
#include <algorithm>
#include <cmath>

namespace swingrisk {
namespace risk {

std::vector<ProfitTarget> ProfitLadderEngine::calculate(
    double entry_price,
    const RegimeConfig& config,
    double current_true_range
) const {
    if (!std::isfinite(entry_price) || entry_price <= 0.0) {
        throw InvalidInput("entry price must be positive");
    }
    if (!std::isfinite(current_true_range) || current_true_range <= 0.0) {
        throw InvalidInput("true range must be positive");
    }

    std::vector<ProfitTarget> targets;
    targets.reserve(kProfitLevelCount);

    for (std::size_t i = 0; i < kProfitLevelCount; ++i) {
        const double base_price = entry_price * (1.0 + config.profit_levels_pct[i] / 100.0);
        const double tr_price = entry_price + current_true_range * config.tr_profit_multipliers[i];

        // Optimistic target wins
        const double final_price = std::max(base_price, tr_price);

        ProfitTarget target;
        target.level = static_cast<int>(i) + 1;
        target.price = final_price;
        target.pct = ((final_price - entry_price) / entry_price) * 100.0;
        target.cumulative_closed = config.position_scaling_pct[i];
        target.position_to_close = (i == 0)
            ? config.position_scaling_pct[0]
            : config.position_scaling_pct[i] - config.position_scaling_pct[i - 1];
        target.method = (tr_price > base_price) ? "tr_based" : "pct_based";
        targets.push_back(target);
    }

    return targets;
}

} // namespace risk
} // namespace swingrisk
