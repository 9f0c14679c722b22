#pragma once

#include "analytics/RegimeClassifier.h"
#include "common/Types.h"
#include "risk/RegimeConfig.h"
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace swingrisk {
namespace risk {

// Multiplicative rule adjustment. Multipliers compose by product,
// urgency by max.
struct RuleAdjustment {
    double stop_multiplier = 1.0;
    double profit_multiplier = 1.0;
    double urgency_factor = 1.0;
    bool emergency = false;
    std::string reason;

    bool isTrivial() const;
    bool sameEffect(const RuleAdjustment& other) const;
    void appendReason(const std::string& text);
};

struct TransitionResult {
    RegimeType previous_regime = RegimeType::BULL_NORMAL;
    RegimeType current_regime = RegimeType::BULL_NORMAL;
    bool transition_detected = false;
    RuleAdjustment adjustment;
};

struct TransitionRecord {
    int day = 0;
    std::string symbol;
    RegimeType from_regime = RegimeType::BULL_NORMAL;
    RegimeType to_regime = RegimeType::BULL_NORMAL;
    bool transition_detected = false;
    RuleAdjustment adjustment;
};

// Detects regime change between two snapshots and derives the rule adjustment.
// Owns an append-only log of every evaluation; one instance per orchestrator.
class RegimeTransitionManager {
public:
    RegimeTransitionManager() = default;
    explicit RegimeTransitionManager(const analytics::RegimeClassifier& classifier)
        : classifier_(classifier) {}

    // previous 없음 = 전환 없음, 기본 조정
    TransitionResult evaluate(
        const MarketSnapshot& current,
        const std::optional<MarketSnapshot>& previous,
        const std::string& symbol = ""
    );

    static RuleAdjustment computeBaseAdjustment(const MarketSnapshot& current, const MarketSnapshot& previous);
    static std::optional<RuleAdjustment> checkEmergencyProtocols(const MarketSnapshot& current,
                                                                 const MarketSnapshot& previous);

    static RegimeConfig applyAdjustment(const RegimeConfig& config, const RuleAdjustment& adjustment);

    std::vector<TransitionRecord> history() const;
    std::size_t historySize() const;
    const analytics::RegimeClassifier& classifier() const { return classifier_; }

private:
    void appendHistory(const TransitionRecord& record);

    analytics::RegimeClassifier classifier_;
    mutable std::mutex history_mutex_;
    std::vector<TransitionRecord> history_;
};

} // namespace risk
} // namespace swingrisk
