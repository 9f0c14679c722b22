#pragma once

#include "common/Types.h"
#include <array>
#include <string>

namespace swingrisk {
namespace risk {

// 레짐별 손절/익절 규칙 묶음
struct RegimeConfig {
    double stop_loss_pct = -8.0;                               // 음수 (%)
    std::array<double, kProfitLevelCount> profit_levels_pct{{12.0, 25.0, 40.0}};
    std::array<double, kProfitLevelCount> position_scaling_pct{{25.0, 50.0, 100.0}};  // 누적 청산 비율
    double tr_stop_multiplier = 1.8;
    std::array<double, kProfitLevelCount> tr_profit_multipliers{{2.0, 3.5, 5.5}};
    int max_hold_days = 3;
    std::string description;
};

// One fixed RegimeConfig per RegimeType. Validated once when loaded.
class RegimeConfigTable {
public:
    RegimeConfigTable();

    static RegimeConfigTable defaults();

    const RegimeConfig& at(RegimeType regime) const { return configs_[regimeIndex(regime)]; }
    void set(RegimeType regime, const RegimeConfig& config);

    // Throws ConfigError naming the first violated rule.
    void validate() const;
    static void validate(RegimeType regime, const RegimeConfig& config);

    // Grid-search helper: stop side (stop_loss_pct, tr_stop_multiplier) and
    // profit side (profit_levels_pct, tr_profit_multipliers) scaled independently.
    RegimeConfigTable scaled(double stop_scalar, double profit_scalar) const;

private:
    std::array<RegimeConfig, kRegimeCount> configs_;
};

} // namespace risk
} // namespace swingrisk
