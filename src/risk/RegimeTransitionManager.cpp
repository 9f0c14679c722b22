#include "risk/RegimeTransitionManager.h"
#include "common/Logger.h"
#include <algorithm>
#include <cmath>

namespace swingrisk {
namespace risk {

namespace {
constexpr double EPS = 1e-9;

constexpr double VIX_SHOCK_DELTA = 15.0;
constexpr double BREADTH_DETERIORATION_DELTA = -25.0;
constexpr double BREADTH_IMPROVEMENT_DELTA = 20.0;
constexpr double MOMENTUM_COLLAPSE_QUOTIENT = 0.5;
constexpr double MOMENTUM_SURGE_QUOTIENT = 2.0;

// Emergency thresholds
constexpr double BREADTH_COLLAPSE_DELTA = -30.0;
constexpr double VOL_EXPLOSION_VIX = 60.0;
constexpr double VOL_EXPLOSION_DELTA = 20.0;
constexpr double MOMENTUM_COLLAPSE_NOW = 0.1;
constexpr double MOMENTUM_COLLAPSE_BEFORE = 1.0;

std::string fmt1(double v) {
    return fmt::format("{:+.1f}", v);
}

std::string fmt3(double v) {
    return fmt::format("{:.3f}", v);
}

RuleAdjustment makeEmergency(double stop, double profit, double urgency, const std::string& reason) {
    RuleAdjustment adj;
    adj.stop_multiplier = stop;
    adj.profit_multiplier = profit;
    adj.urgency_factor = urgency;
    adj.emergency = true;
    adj.reason = "EMERGENCY " + reason;
    return adj;
}
} // namespace

bool RuleAdjustment::isTrivial() const {
    return std::fabs(stop_multiplier - 1.0) < EPS &&
           std::fabs(profit_multiplier - 1.0) < EPS &&
           std::fabs(urgency_factor - 1.0) < EPS;
}

bool RuleAdjustment::sameEffect(const RuleAdjustment& other) const {
    return std::fabs(stop_multiplier - other.stop_multiplier) < EPS &&
           std::fabs(profit_multiplier - other.profit_multiplier) < EPS &&
           std::fabs(urgency_factor - other.urgency_factor) < EPS;
}

void RuleAdjustment::appendReason(const std::string& text) {
    if (!reason.empty()) {
        reason += "; ";
    }
    reason += text;
}

RuleAdjustment RegimeTransitionManager::computeBaseAdjustment(
    const MarketSnapshot& current,
    const MarketSnapshot& previous
) {
    RuleAdjustment adj;

    // 1. VIX shock
    const double vix_delta = current.vix - previous.vix;
    if (std::fabs(vix_delta) > VIX_SHOCK_DELTA) {
        double stop_mult = 1.0;
        double profit_mult = 1.0;
        if (vix_delta > 0.0) {
            stop_mult = 1.2 + vix_delta / 50.0;
            profit_mult = 1.1 + vix_delta / 100.0;
        } else {
            stop_mult = 0.9 + vix_delta / 100.0;
            profit_mult = 0.95 + vix_delta / 200.0;
        }
        adj.stop_multiplier *= stop_mult;
        adj.profit_multiplier *= profit_mult;
        adj.appendReason("VIX " + fmt1(vix_delta) + ": stop x" + fmt3(stop_mult) +
                         ", profit x" + fmt3(profit_mult));
    }

    // 2. Breadth
    if (current.t2108 && previous.t2108) {
        const double t2108_delta = *current.t2108 - *previous.t2108;
        if (t2108_delta < BREADTH_DETERIORATION_DELTA) {
            adj.stop_multiplier *= 0.7;
            adj.profit_multiplier *= 0.8;
            adj.urgency_factor = std::max(adj.urgency_factor, 2.0);
            adj.appendReason("T2108 " + fmt1(t2108_delta) + ": breadth deterioration, tighten");
        } else if (t2108_delta > BREADTH_IMPROVEMENT_DELTA) {
            adj.profit_multiplier *= 1.3;
            adj.appendReason("T2108 " + fmt1(t2108_delta) + ": breadth improvement, extend targets");
        }
    }

    // 3. Momentum
    if (current.momentum_ratio && previous.momentum_ratio && *previous.momentum_ratio > 0.0) {
        const double quotient = *current.momentum_ratio / *previous.momentum_ratio;
        if (quotient < MOMENTUM_COLLAPSE_QUOTIENT) {
            adj.stop_multiplier *= 0.8;
            adj.urgency_factor = std::max(adj.urgency_factor, 1.5);
            adj.appendReason("momentum x" + fmt3(quotient) + ": momentum fading, tighten");
        } else if (quotient > MOMENTUM_SURGE_QUOTIENT) {
            adj.profit_multiplier *= 1.2;
            adj.appendReason("momentum x" + fmt3(quotient) + ": momentum surge, extend targets");
        }
    }

    return adj;
}

std::optional<RuleAdjustment> RegimeTransitionManager::checkEmergencyProtocols(
    const MarketSnapshot& current,
    const MarketSnapshot& previous
) {
    if (current.t2108 && previous.t2108) {
        const double t2108_delta = *current.t2108 - *previous.t2108;
        if (t2108_delta < BREADTH_COLLAPSE_DELTA) {
            return makeEmergency(0.6, 0.7, 2.0, "breadth collapse (T2108 " + fmt1(t2108_delta) + ")");
        }
    }

    const double vix_delta = current.vix - previous.vix;
    if (current.vix > VOL_EXPLOSION_VIX && vix_delta > VOL_EXPLOSION_DELTA) {
        return makeEmergency(1.5, 1.4, 0.7, "volatility explosion (VIX " + fmt1(vix_delta) + ")");
    }

    if (current.momentum_ratio && previous.momentum_ratio &&
        *current.momentum_ratio < MOMENTUM_COLLAPSE_NOW &&
        *previous.momentum_ratio > MOMENTUM_COLLAPSE_BEFORE) {
        return makeEmergency(0.5, 0.6, 3.0, "momentum collapse");
    }

    return std::nullopt;
}

TransitionResult RegimeTransitionManager::evaluate(
    const MarketSnapshot& current,
    const std::optional<MarketSnapshot>& previous,
    const std::string& symbol
) {
    TransitionResult result;
    result.current_regime = classifier_.classify(current);

    if (!previous) {
        result.previous_regime = result.current_regime;
        return result;
    }

    result.previous_regime = classifier_.classify(*previous);
    result.transition_detected = (result.previous_regime != result.current_regime);

    result.adjustment = computeBaseAdjustment(current, *previous);
    if (auto emergency = checkEmergencyProtocols(current, *previous)) {
        LOG_WARN("{} {} (replaces: {})", symbol, emergency->reason,
                 result.adjustment.reason.empty() ? "none" : result.adjustment.reason);
        result.adjustment = *emergency;
    }

    if (result.transition_detected) {
        result.adjustment.appendReason(std::string("regime ") + regimeToString(result.previous_regime) +
                                       " -> " + regimeToString(result.current_regime));
        LOG_INFO("{} regime transition {} -> {} (stop x{:.3f}, profit x{:.3f}, urgency {:.2f})",
                 symbol, regimeToString(result.previous_regime), regimeToString(result.current_regime),
                 result.adjustment.stop_multiplier, result.adjustment.profit_multiplier,
                 result.adjustment.urgency_factor);
    }

    TransitionRecord record;
    record.day = current.day;
    record.symbol = symbol;
    record.from_regime = result.previous_regime;
    record.to_regime = result.current_regime;
    record.transition_detected = result.transition_detected;
    record.adjustment = result.adjustment;
    appendHistory(record);

    return result;
}

RegimeConfig RegimeTransitionManager::applyAdjustment(const RegimeConfig& config,
                                                      const RuleAdjustment& adjustment) {
    RegimeConfig out = config;
    out.stop_loss_pct *= adjustment.stop_multiplier;
    out.tr_stop_multiplier *= adjustment.stop_multiplier;
    for (std::size_t i = 0; i < kProfitLevelCount; ++i) {
        out.profit_levels_pct[i] *= adjustment.profit_multiplier;
        out.tr_profit_multipliers[i] *= adjustment.profit_multiplier;
    }

    if (adjustment.urgency_factor > 1.0) {
        const int shortened = static_cast<int>(std::floor(config.max_hold_days / adjustment.urgency_factor));
        out.max_hold_days = std::max(1, shortened);
    }
    return out;
}

void RegimeTransitionManager::appendHistory(const TransitionRecord& record) {
    std::lock_guard<std::mutex> lock(history_mutex_);
    history_.push_back(record);
}

std::vector<TransitionRecord> RegimeTransitionManager::history() const {
    std::lock_guard<std::mutex> lock(history_mutex_);
    return history_;
}

std::size_t RegimeTransitionManager::historySize() const {
    std::lock_guard<std::mutex> lock(history_mutex_);
    return history_.size();
}

} // namespace risk
} // namespace swingrisk
