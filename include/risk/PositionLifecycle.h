#pragma once

#include "analytics/RegimeClassifier.h"
#include "analytics/TechnicalIndicators.h"
#include "common/Types.h"
#include "risk/AdaptiveStopEngine.h"
#include "risk/ProfitLadderEngine.h"
#include "risk/RegimeConfig.h"
#include "risk/RegimeTransitionManager.h"
#include <array>
#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace swingrisk {
namespace risk {

enum class PositionState { OPEN, ACTIVE, CLOSED };

enum class ActionType {
    STOP_LOSS,
    PROFIT_TAKING,
    REGIME_ADJUSTMENT,
    TIME_EXIT,
    MANUAL_CLOSE
};

inline const char* positionStateToString(PositionState state) {
    switch (state) {
        case PositionState::OPEN: return "OPEN";
        case PositionState::ACTIVE: return "ACTIVE";
        case PositionState::CLOSED: return "CLOSED";
    }
    return "UNKNOWN";
}

inline const char* actionTypeToString(ActionType type) {
    switch (type) {
        case ActionType::STOP_LOSS: return "STOP_LOSS_TRIGGERED";
        case ActionType::PROFIT_TAKING: return "PROFIT_TAKING";
        case ActionType::REGIME_ADJUSTMENT: return "REGIME_ADJUSTMENT";
        case ActionType::TIME_EXIT: return "TIME_EXIT";
        case ActionType::MANUAL_CLOSE: return "MANUAL_CLOSE";
    }
    return "UNKNOWN";
}

// 하루 업데이트에서 실행된 액션
struct PositionAction {
    int day = 0;                      // days_held at execution
    ActionType type = ActionType::TIME_EXIT;
    int level = 0;                    // profit level (1-based), 0 otherwise
    double price = 0.0;
    double position_affected = 0.0;   // % of original position
    double pnl_impact = 0.0;          // fraction of original position
    std::string detail;
};

// Which rule layers the lifecycle applies. Backtest passes disable layers.
struct RuleSet {
    bool stop_loss = true;
    bool profit_taking = true;
    bool regime_adjustment = true;
    bool time_exit = true;
    std::optional<int> fixed_hold_days;   // 레짐 보유기간 대신 고정 기간
    bool log_trades = true;               // 체결 액션을 trades.log에 기록

    static RuleSet all() { return RuleSet(); }
    static RuleSet stopOnly() {
        RuleSet r;
        r.profit_taking = false;
        r.regime_adjustment = false;
        return r;
    }
    static RuleSet profitOnly() {
        RuleSet r;
        r.stop_loss = false;
        r.regime_adjustment = false;
        return r;
    }
    static RuleSet baseline(int hold_days) {
        RuleSet r;
        r.stop_loss = false;
        r.profit_taking = false;
        r.regime_adjustment = false;
        r.fixed_hold_days = hold_days;
        return r;
    }
};

struct TradePosition {
    std::string symbol;
    double entry_price = 0.0;
    int entry_date = 0;
    double position_size_pct = 100.0;
    RegimeType regime_at_entry = RegimeType::BULL_NORMAL;
    double vix_at_entry = 0.0;
    MarketSnapshot entry_snapshot;

    // 손절/익절 레벨
    double stop_level = 0.0;
    double initial_stop_level = 0.0;
    std::string stop_method;
    std::array<double, kProfitLevelCount> profit_levels{};
    std::array<double, kProfitLevelCount> profit_scales{};
    std::vector<ProfitTarget> profit_targets;

    bool stop_triggered = false;
    std::set<int> profit_levels_hit;      // 0-based level index
    double remaining_position_pct = 100.0;
    double realized_pnl = 0.0;            // fraction of original position
    double max_profit_seen = 0.0;
    double max_loss_seen = 0.0;
    int days_held = 0;

    RegimeConfig effective_config;        // 진입 시 전환 조정 반영
    int base_max_hold_days = 0;
    RuleAdjustment applied_adjustment;

    PositionState state = PositionState::OPEN;
    std::vector<PositionAction> actions;
};

// Read-only trade history record
struct ClosedTrade {
    std::string symbol;
    RegimeType regime_at_entry = RegimeType::BULL_NORMAL;
    double entry_price = 0.0;
    double exit_price = 0.0;
    double position_size_pct = 100.0;
    double realized_return = 0.0;
    int days_held = 0;
    std::string exit_reason;              // stop_loss|profit_taking|time_exit|end_of_data|manual
    int profit_levels_hit = 0;
    bool stop_triggered = false;
    double max_profit_seen = 0.0;
    double max_loss_seen = 0.0;
};

struct OpenResult {
    TradePosition position;
    StopLevel stop;
    double true_range = 0.0;
    int expected_hold_days = 0;
    bool transition_detected = false;
    RuleAdjustment adjustment;
};

struct UpdateResult {
    std::string symbol;
    std::vector<PositionAction> actions;
    PositionState status = PositionState::ACTIVE;
    std::optional<double> current_pnl;    // ACTIVE일 때 평가손익
    double realized_pnl = 0.0;
    double remaining_pct = 0.0;
    int days_held = 0;
    std::optional<ClosedTrade> closed_trade;
};

// Owns every active position's state machine (OPEN -> ACTIVE -> CLOSED).
// Mutations are serialized internally.
class PositionLifecycle {
public:
    explicit PositionLifecycle(
        const RegimeConfigTable& configs = RegimeConfigTable::defaults(),
        const analytics::RegimeClassifier& classifier = analytics::RegimeClassifier(),
        const RuleSet& rules = RuleSet::all()
    );

    OpenResult open(
        const std::string& symbol,
        double entry_price,
        const MarketSnapshot& snapshot,
        double position_size_pct = 100.0
    );

    // One trigger per call, priority: stop > profit > regime adjustment > time exit
    UpdateResult update(
        const std::string& symbol,
        double daily_high,
        double daily_low,
        double daily_close,
        const MarketSnapshot& snapshot
    );

    // Closes whatever remains at price. No-op (nullopt) for an unknown symbol.
    std::optional<ClosedTrade> closePosition(
        const std::string& symbol,
        double price,
        const std::string& reason = "manual"
    );

    std::optional<TradePosition> getPosition(const std::string& symbol) const;
    std::vector<TradePosition> getActivePositions() const;
    std::vector<ClosedTrade> getTradeHistory() const;
    bool isActive(const std::string& symbol) const;

    // Forget the last observed market snapshot (next open sees no transition)
    void resetMarketContext();

    const RegimeTransitionManager& transitionManager() const { return transition_manager_; }
    const RuleSet& rules() const { return rules_; }
    const RegimeConfigTable& configs() const { return configs_; }

    static void validateSnapshot(const MarketSnapshot& snapshot);

    // 스냅샷에 True Range가 없을 때 진입가 대비 기본값
    static constexpr double kDefaultTrueRangePct = 0.02;
    static constexpr double kRegimeReadjustVixDelta = 15.0;

private:
    bool tryStopLoss(TradePosition& pos, double daily_low, UpdateResult& result);
    bool tryProfitTaking(TradePosition& pos, double daily_high, UpdateResult& result);
    bool tryRegimeReadjustment(TradePosition& pos, const MarketSnapshot& snapshot, UpdateResult& result);
    bool tryTimeExit(TradePosition& pos, double daily_close, UpdateResult& result);

    void recordAction(TradePosition& pos, const PositionAction& action, UpdateResult* result);
    ClosedTrade finalizePosition(TradePosition& pos, double exit_price, const std::string& exit_reason);
    int holdLimit(const TradePosition& pos) const;

    RegimeConfigTable configs_;
    analytics::RegimeClassifier classifier_;
    RuleSet rules_;

    AdaptiveStopEngine stop_engine_;
    ProfitLadderEngine ladder_engine_;
    RegimeTransitionManager transition_manager_;
    analytics::TrueRangeHistory true_range_history_;

    std::map<std::string, TradePosition> positions_;
    std::vector<ClosedTrade> trade_history_;
    std::optional<MarketSnapshot> last_snapshot_;

    mutable std::recursive_mutex mutex_;
};

} // namespace risk
} // namespace swingrisk
