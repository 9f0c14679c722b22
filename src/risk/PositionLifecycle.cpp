#include "risk/PositionLifecycle.h"
#include "common/Errors.h"
#include "common/Logger.h"
#include <algorithm>
#include <cmath>

namespace swingrisk {
namespace risk {

namespace {
constexpr double EPS = 1e-9;

bool isPositiveFinite(double v) {
    return std::isfinite(v) && v > 0.0;
}

int shortenedHold(int hold_days, double urgency_factor) {
    if (urgency_factor <= 1.0) {
        return hold_days;
    }
    return std::max(1, static_cast<int>(std::floor(hold_days / urgency_factor)));
}

std::string exitReasonFor(ActionType type) {
    switch (type) {
        case ActionType::STOP_LOSS: return "stop_loss";
        case ActionType::PROFIT_TAKING: return "profit_taking";
        case ActionType::TIME_EXIT: return "time_exit";
        default: return "manual";
    }
}
} // namespace

PositionLifecycle::PositionLifecycle(
    const RegimeConfigTable& configs,
    const analytics::RegimeClassifier& classifier,
    const RuleSet& rules
)
    : configs_(configs)
    , classifier_(classifier)
    , rules_(rules)
    , transition_manager_(classifier)
{
    configs_.validate();
    if (rules_.fixed_hold_days && *rules_.fixed_hold_days < 1) {
        throw ConfigError("fixed_hold_days must be >= 1");
    }
}

void PositionLifecycle::validateSnapshot(const MarketSnapshot& snapshot) {
    if (!isPositiveFinite(snapshot.vix)) {
        throw InvalidInput("snapshot vix must be positive");
    }
    if (snapshot.t2108 && (!std::isfinite(*snapshot.t2108) || *snapshot.t2108 < 0.0 || *snapshot.t2108 > 100.0)) {
        throw InvalidInput("snapshot t2108 must be within [0, 100]");
    }
    if (snapshot.momentum_ratio && !isPositiveFinite(*snapshot.momentum_ratio)) {
        throw InvalidInput("snapshot momentum_ratio must be positive");
    }
    if (snapshot.true_range && !isPositiveFinite(*snapshot.true_range)) {
        throw InvalidInput("snapshot true_range must be positive");
    }
}

// ===== Open =====

OpenResult PositionLifecycle::open(
    const std::string& symbol,
    double entry_price,
    const MarketSnapshot& snapshot,
    double position_size_pct
) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);

    // 모든 검증은 상태 변경 전에
    if (symbol.empty()) {
        throw InvalidInput("symbol must not be empty");
    }
    if (!isPositiveFinite(entry_price)) {
        throw InvalidInput(symbol + " entry price must be positive");
    }
    if (!std::isfinite(position_size_pct) || position_size_pct <= 0.0 || position_size_pct > 100.0) {
        throw InvalidInput(symbol + " position size must be within (0, 100]");
    }
    validateSnapshot(snapshot);
    if (positions_.count(symbol) > 0) {
        LOG_WARN("{} already has an active position", symbol);
        throw DuplicatePosition(symbol);
    }

    const RegimeType regime = classifier_.classify(snapshot);

    // Transition vs. the previously observed market context
    const TransitionResult transition = transition_manager_.evaluate(snapshot, last_snapshot_, symbol);
    RegimeConfig effective = configs_.at(regime);
    if (!transition.adjustment.isTrivial()) {
        effective = RegimeTransitionManager::applyAdjustment(effective, transition.adjustment);
    }

    const double true_range = snapshot.true_range.value_or(entry_price * kDefaultTrueRangePct);
    const StopLevel stop = stop_engine_.calculate(
        entry_price, effective, true_range, snapshot.t2108, true_range_history_, symbol);
    const std::vector<ProfitTarget> targets = ladder_engine_.calculate(entry_price, effective, true_range);
    true_range_history_.record(symbol, true_range);

    TradePosition pos;
    pos.symbol = symbol;
    pos.entry_price = entry_price;
    pos.entry_date = snapshot.day;
    pos.position_size_pct = position_size_pct;
    pos.regime_at_entry = regime;
    pos.vix_at_entry = snapshot.vix;
    pos.entry_snapshot = snapshot;
    pos.stop_level = stop.price;
    pos.initial_stop_level = stop.price;
    pos.stop_method = stop.method;
    pos.profit_targets = targets;
    for (std::size_t i = 0; i < kProfitLevelCount && i < targets.size(); ++i) {
        pos.profit_levels[i] = targets[i].price;
        pos.profit_scales[i] = targets[i].cumulative_closed;
    }
    pos.effective_config = effective;
    pos.base_max_hold_days = effective.max_hold_days;
    pos.remaining_position_pct = 100.0;
    pos.state = PositionState::ACTIVE;

    OpenResult result;
    result.position = pos;
    result.stop = stop;
    result.true_range = true_range;
    result.expected_hold_days = holdLimit(pos);
    result.transition_detected = transition.transition_detected;
    result.adjustment = transition.adjustment;

    positions_.emplace(symbol, std::move(pos));
    last_snapshot_ = snapshot;

    LOG_INFO("{} opened @ {:.4f} [{}] stop {:.4f} ({:.2f}%, {}), targets {:.4f}/{:.4f}/{:.4f}",
             symbol, entry_price, regimeToString(regime), stop.price, stop.pct, stop.method,
             targets[0].price, targets[1].price, targets[2].price);
    return result;
}

// ===== Update =====

UpdateResult PositionLifecycle::update(
    const std::string& symbol,
    double daily_high,
    double daily_low,
    double daily_close,
    const MarketSnapshot& snapshot
) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);

    auto it = positions_.find(symbol);
    if (it == positions_.end()) {
        throw PositionNotFound(symbol);
    }
    if (!isPositiveFinite(daily_high) || !isPositiveFinite(daily_low) || !isPositiveFinite(daily_close)) {
        throw InvalidInput(symbol + " daily prices must be positive");
    }
    if (daily_low > daily_high) {
        throw InvalidInput(symbol + " daily low above daily high");
    }
    validateSnapshot(snapshot);

    TradePosition& pos = it->second;
    pos.days_held++;
    pos.max_profit_seen = std::max(pos.max_profit_seen, (daily_high - pos.entry_price) / pos.entry_price);
    pos.max_loss_seen = std::min(pos.max_loss_seen, (daily_low - pos.entry_price) / pos.entry_price);
    last_snapshot_ = snapshot;

    UpdateResult result;
    result.symbol = symbol;

    // First match wins
    bool acted = tryStopLoss(pos, daily_low, result);
    if (!acted) acted = tryProfitTaking(pos, daily_high, result);
    if (!acted) acted = tryRegimeReadjustment(pos, snapshot, result);
    if (!acted) tryTimeExit(pos, daily_close, result);

    result.realized_pnl = pos.realized_pnl;
    result.remaining_pct = pos.remaining_position_pct;
    result.days_held = pos.days_held;

    if (pos.remaining_position_pct <= EPS) {
        const PositionAction& last = pos.actions.back();
        result.closed_trade = finalizePosition(pos, last.price, exitReasonFor(last.type));
        result.status = PositionState::CLOSED;
        positions_.erase(it);
        return result;
    }

    result.status = PositionState::ACTIVE;
    result.current_pnl = pos.realized_pnl +
        ((daily_close - pos.entry_price) / pos.entry_price) * (pos.remaining_position_pct / 100.0);
    return result;
}

bool PositionLifecycle::tryStopLoss(TradePosition& pos, double daily_low, UpdateResult& result) {
    if (!rules_.stop_loss || pos.stop_triggered || pos.remaining_position_pct <= EPS) {
        return false;
    }
    if (daily_low > pos.stop_level) {
        return false;
    }

    const double loss_per_unit = (pos.stop_level - pos.entry_price) / pos.entry_price;

    PositionAction action;
    action.day = pos.days_held;
    action.type = ActionType::STOP_LOSS;
    action.price = pos.stop_level;
    action.position_affected = pos.remaining_position_pct;
    action.pnl_impact = loss_per_unit * (pos.remaining_position_pct / 100.0);
    action.detail = "stop " + pos.stop_method;

    pos.stop_triggered = true;
    pos.realized_pnl += action.pnl_impact;
    pos.remaining_position_pct = 0.0;
    recordAction(pos, action, &result);
    return true;
}

bool PositionLifecycle::tryProfitTaking(TradePosition& pos, double daily_high, UpdateResult& result) {
    if (!rules_.profit_taking || pos.remaining_position_pct <= EPS) {
        return false;
    }

    for (std::size_t i = 0; i < pos.profit_targets.size(); ++i) {
        const int index = static_cast<int>(i);
        const ProfitTarget& target = pos.profit_targets[i];
        if (pos.profit_levels_hit.count(index) > 0 || target.price > daily_high) {
            continue;
        }

        const double closed = std::min(target.position_to_close, pos.remaining_position_pct);
        const double profit_per_unit = (target.price - pos.entry_price) / pos.entry_price;

        PositionAction action;
        action.day = pos.days_held;
        action.type = ActionType::PROFIT_TAKING;
        action.level = target.level;
        action.price = target.price;
        action.position_affected = closed;
        action.pnl_impact = profit_per_unit * (closed / 100.0);
        action.detail = "level " + std::to_string(target.level) + " " + target.method;

        pos.profit_levels_hit.insert(index);
        pos.realized_pnl += action.pnl_impact;
        pos.remaining_position_pct = std::max(0.0, pos.remaining_position_pct - closed);
        recordAction(pos, action, &result);
        return true;  // 하루 1레벨
    }
    return false;
}

bool PositionLifecycle::tryRegimeReadjustment(TradePosition& pos, const MarketSnapshot& snapshot,
                                              UpdateResult& result) {
    if (!rules_.regime_adjustment || pos.remaining_position_pct <= EPS) {
        return false;
    }
    if (std::fabs(snapshot.vix - pos.vix_at_entry) <= kRegimeReadjustVixDelta) {
        return false;
    }

    const TransitionResult transition = transition_manager_.evaluate(snapshot, pos.entry_snapshot, pos.symbol);
    const RuleAdjustment& adj = transition.adjustment;
    if (adj.isTrivial() || adj.sameEffect(pos.applied_adjustment)) {
        return false;
    }

    // Always rescale from the initial levels so repeated checks never compound
    const double initial_distance = pos.entry_price - pos.initial_stop_level;
    const double scaled_pct = -(initial_distance * adj.stop_multiplier / pos.entry_price) * 100.0;
    const double new_pct = AdaptiveStopEngine::clampStopPct(scaled_pct);
    const double old_stop = pos.stop_level;
    pos.stop_level = pos.entry_price * (1.0 + new_pct / 100.0);

    pos.applied_adjustment = adj;
    pos.effective_config.max_hold_days = shortenedHold(pos.base_max_hold_days, adj.urgency_factor);

    PositionAction action;
    action.day = pos.days_held;
    action.type = ActionType::REGIME_ADJUSTMENT;
    action.price = pos.stop_level;
    action.position_affected = 0.0;
    action.pnl_impact = 0.0;
    action.detail = adj.reason;
    recordAction(pos, action, &result);

    LOG_INFO("{} stop rescaled {:.4f} -> {:.4f} (x{:.3f}), max hold {} days",
             pos.symbol, old_stop, pos.stop_level, adj.stop_multiplier, pos.effective_config.max_hold_days);
    return true;
}

bool PositionLifecycle::tryTimeExit(TradePosition& pos, double daily_close, UpdateResult& result) {
    if (!rules_.time_exit || pos.remaining_position_pct <= EPS) {
        return false;
    }
    if (pos.days_held < holdLimit(pos)) {
        return false;
    }

    PositionAction action;
    action.day = pos.days_held;
    action.type = ActionType::TIME_EXIT;
    action.price = daily_close;
    action.position_affected = pos.remaining_position_pct;
    action.pnl_impact = ((daily_close - pos.entry_price) / pos.entry_price) * (pos.remaining_position_pct / 100.0);
    action.detail = "held " + std::to_string(pos.days_held) + " days";

    pos.realized_pnl += action.pnl_impact;
    pos.remaining_position_pct = 0.0;
    recordAction(pos, action, &result);
    return true;
}

// ===== Close =====

std::optional<ClosedTrade> PositionLifecycle::closePosition(
    const std::string& symbol,
    double price,
    const std::string& reason
) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);

    auto it = positions_.find(symbol);
    if (it == positions_.end()) {
        return std::nullopt;
    }
    if (!isPositiveFinite(price)) {
        throw InvalidInput(symbol + " close price must be positive");
    }

    TradePosition& pos = it->second;
    PositionAction action;
    action.day = pos.days_held;
    action.type = ActionType::MANUAL_CLOSE;
    action.price = price;
    action.position_affected = pos.remaining_position_pct;
    action.pnl_impact = ((price - pos.entry_price) / pos.entry_price) * (pos.remaining_position_pct / 100.0);
    action.detail = reason;

    pos.realized_pnl += action.pnl_impact;
    pos.remaining_position_pct = 0.0;
    recordAction(pos, action, nullptr);

    ClosedTrade trade = finalizePosition(pos, price, reason);
    positions_.erase(it);
    return trade;
}

void PositionLifecycle::recordAction(TradePosition& pos, const PositionAction& action, UpdateResult* result) {
    pos.actions.push_back(action);
    if (result) {
        result->actions.push_back(action);
    }
    if (rules_.log_trades) {
        Logger::getInstance().logTrade(pos.symbol, actionTypeToString(action.type),
                                       action.price, action.position_affected, action.pnl_impact);
    }
}

ClosedTrade PositionLifecycle::finalizePosition(TradePosition& pos, double exit_price, const std::string& exit_reason) {
    pos.state = PositionState::CLOSED;

    ClosedTrade trade;
    trade.symbol = pos.symbol;
    trade.regime_at_entry = pos.regime_at_entry;
    trade.entry_price = pos.entry_price;
    trade.exit_price = exit_price;
    trade.position_size_pct = pos.position_size_pct;
    trade.realized_return = pos.realized_pnl;
    trade.days_held = pos.days_held;
    trade.exit_reason = exit_reason;
    trade.profit_levels_hit = static_cast<int>(pos.profit_levels_hit.size());
    trade.stop_triggered = pos.stop_triggered;
    trade.max_profit_seen = pos.max_profit_seen;
    trade.max_loss_seen = pos.max_loss_seen;
    trade_history_.push_back(trade);

    LOG_INFO("{} closed ({}) after {} days, realized {:.2f}%",
             pos.symbol, exit_reason, pos.days_held, pos.realized_pnl * 100.0);
    return trade;
}

int PositionLifecycle::holdLimit(const TradePosition& pos) const {
    if (!rules_.fixed_hold_days) {
        return pos.effective_config.max_hold_days;
    }
    // 고정 보유기간에도 보유 중 긴급도 단축은 적용
    return shortenedHold(*rules_.fixed_hold_days, pos.applied_adjustment.urgency_factor);
}

// ===== Queries =====

std::optional<TradePosition> PositionLifecycle::getPosition(const std::string& symbol) const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    auto it = positions_.find(symbol);
    if (it == positions_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<TradePosition> PositionLifecycle::getActivePositions() const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    std::vector<TradePosition> out;
    out.reserve(positions_.size());
    for (const auto& [symbol, pos] : positions_) {
        out.push_back(pos);
    }
    return out;
}

std::vector<ClosedTrade> PositionLifecycle::getTradeHistory() const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return trade_history_;
}

bool PositionLifecycle::isActive(const std::string& symbol) const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return positions_.count(symbol) > 0;
}

void PositionLifecycle::resetMarketContext() {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    last_snapshot_.reset();
}

} // namespace risk
} // namespace swingrisk
