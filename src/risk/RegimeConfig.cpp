#include "risk/RegimeConfig.h"
#include "common/Errors.h"

#include <cmath>

namespace swingrisk {
namespace risk {

namespace {
RegimeConfig makeConfig(
    double stop_loss_pct,
    std::array<double, kProfitLevelCount> profit_levels,
    std::array<double, kProfitLevelCount> scaling,
    double tr_stop,
    std::array<double, kProfitLevelCount> tr_profit,
    int max_hold_days,
    const std::string& description
) {
    RegimeConfig c;
    c.stop_loss_pct = stop_loss_pct;
    c.profit_levels_pct = profit_levels;
    c.position_scaling_pct = scaling;
    c.tr_stop_multiplier = tr_stop;
    c.tr_profit_multipliers = tr_profit;
    c.max_hold_days = max_hold_days;
    c.description = description;
    return c;
}

bool strictlyAscending(const std::array<double, kProfitLevelCount>& values) {
    for (std::size_t i = 1; i < values.size(); ++i) {
        if (!(values[i] > values[i - 1])) {
            return false;
        }
    }
    return true;
}
} // namespace

RegimeConfigTable::RegimeConfigTable() {
    configs_[regimeIndex(RegimeType::CRISIS_OPPORTUNITY)] = makeConfig(
        -15.0, {{20.0, 35.0, 50.0}}, {{25.0, 50.0, 100.0}}, 2.5, {{3.0, 5.0, 7.0}}, 4,
        "Crisis: wide stops, aggressive profit-taking");
    configs_[regimeIndex(RegimeType::HIGH_VOL_STRESS)] = makeConfig(
        -12.0, {{15.0, 28.0, 45.0}}, {{25.0, 50.0, 100.0}}, 2.0, {{2.5, 4.0, 6.0}}, 3,
        "High-Vol: balanced stops and targets");
    configs_[regimeIndex(RegimeType::BULL_NORMAL)] = makeConfig(
        -8.0, {{12.0, 25.0, 40.0}}, {{25.0, 50.0, 100.0}}, 1.8, {{2.0, 3.5, 5.5}}, 3,
        "Bull: standard defensive, moderate offensive");
    configs_[regimeIndex(RegimeType::LOW_VOL_COMPLACENCY)] = makeConfig(
        -5.0, {{8.0, 15.0, 25.0}}, {{30.0, 60.0, 100.0}}, 1.2, {{1.8, 3.0, 4.5}}, 2,
        "Low-Vol: tight stops, early profit-taking");
}

RegimeConfigTable RegimeConfigTable::defaults() {
    return RegimeConfigTable();
}

void RegimeConfigTable::set(RegimeType regime, const RegimeConfig& config) {
    configs_[regimeIndex(regime)] = config;
}

void RegimeConfigTable::validate() const {
    for (RegimeType regime : kAllRegimes) {
        validate(regime, at(regime));
    }
}

void RegimeConfigTable::validate(RegimeType regime, const RegimeConfig& c) {
    const std::string name = regimeToString(regime);

    if (!std::isfinite(c.stop_loss_pct) || c.stop_loss_pct >= 0.0) {
        throw ConfigError(name + ": stop_loss_pct must be negative");
    }
    if (!strictlyAscending(c.profit_levels_pct) || c.profit_levels_pct[0] <= 0.0) {
        throw ConfigError(name + ": profit_levels must be positive and strictly ascending");
    }
    if (!strictlyAscending(c.position_scaling_pct) || c.position_scaling_pct[0] <= 0.0) {
        throw ConfigError(name + ": position_scaling must be positive and strictly ascending");
    }
    if (std::fabs(c.position_scaling_pct.back() - 100.0) > 1e-9) {
        throw ConfigError(name + ": position_scaling must end at 100");
    }
    if (!(c.tr_stop_multiplier > 0.0)) {
        throw ConfigError(name + ": tr_stop_multiplier must be positive");
    }
    for (double m : c.tr_profit_multipliers) {
        if (!(m > 0.0)) {
            throw ConfigError(name + ": tr_profit_multipliers must be positive");
        }
    }
    if (c.max_hold_days < 1) {
        throw ConfigError(name + ": max_hold_days must be >= 1");
    }
}

RegimeConfigTable RegimeConfigTable::scaled(double stop_scalar, double profit_scalar) const {
    RegimeConfigTable out = *this;
    for (auto& c : out.configs_) {
        c.stop_loss_pct *= stop_scalar;
        c.tr_stop_multiplier *= stop_scalar;
        for (std::size_t i = 0; i < kProfitLevelCount; ++i) {
            c.profit_levels_pct[i] *= profit_scalar;
            c.tr_profit_multipliers[i] *= profit_scalar;
        }
    }
    return out;
}

} // namespace risk
} // namespace swingrisk
