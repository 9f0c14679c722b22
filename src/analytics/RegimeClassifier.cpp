#include "analytics/RegimeClassifier.h"

namespace swingrisk {
namespace analytics {

namespace {
constexpr double WEAK_BREADTH_T2108 = 20.0;
constexpr double WEAK_MOMENTUM_RATIO = 0.8;
constexpr double STRONG_BREADTH_T2108 = 60.0;
constexpr double STRONG_MOMENTUM_RATIO = 2.0;
constexpr double LOW_VOL_DEESCALATION_VIX = 20.0;
} // namespace

RegimeType RegimeClassifier::classifyByVix(double vix) const {
    if (vix >= bands_.crisis_min) {
        return RegimeType::CRISIS_OPPORTUNITY;
    }
    if (vix >= bands_.high_vol_min) {
        return RegimeType::HIGH_VOL_STRESS;
    }
    if (vix >= bands_.bull_normal_min) {
        return RegimeType::BULL_NORMAL;
    }
    return RegimeType::LOW_VOL_COMPLACENCY;
}

RegimeType RegimeClassifier::classify(double vix,
                                      std::optional<double> t2108,
                                      std::optional<double> momentum_ratio) const {
    const RegimeType primary = classifyByVix(vix);

    // Secondary factors need both breadth and momentum
    if (!t2108 || !momentum_ratio) {
        return primary;
    }

    // 약한 breadth + 모멘텀 붕괴 -> 한 단계 위험 상향
    if (*t2108 < WEAK_BREADTH_T2108 && *momentum_ratio < WEAK_MOMENTUM_RATIO) {
        if (primary == RegimeType::BULL_NORMAL) {
            return RegimeType::HIGH_VOL_STRESS;
        }
        if (primary == RegimeType::LOW_VOL_COMPLACENCY) {
            return RegimeType::BULL_NORMAL;
        }
        return primary;
    }

    // 강한 breadth + 모멘텀 -> 한 단계 완화
    if (*t2108 > STRONG_BREADTH_T2108 && *momentum_ratio > STRONG_MOMENTUM_RATIO) {
        if (primary == RegimeType::HIGH_VOL_STRESS) {
            return RegimeType::BULL_NORMAL;
        }
        if (primary == RegimeType::BULL_NORMAL && vix < LOW_VOL_DEESCALATION_VIX) {
            return RegimeType::LOW_VOL_COMPLACENCY;
        }
    }

    return primary;
}

RegimeAnalysis RegimeClassifier::analyze(const MarketSnapshot& snapshot) const {
    RegimeAnalysis result;
    result.primary_regime = classifyByVix(snapshot.vix);
    result.regime = classify(snapshot);
    result.secondary_adjusted = (result.regime != result.primary_regime);
    result.confidence = classificationConfidence(snapshot.vix);

    result.description = regimeToString(result.regime);
    if (result.secondary_adjusted) {
        result.description += " (adjusted from ";
        result.description += regimeToString(result.primary_regime);
        result.description += " by breadth/momentum)";
    }
    return result;
}

double RegimeClassifier::classificationConfidence(double vix) {
    if (vix > 40.0 || vix < 12.0) {
        return 0.9;
    }
    if (vix >= 15.0 && vix <= 25.0) {
        return 0.7;
    }
    return 0.6;
}

} // namespace analytics
} // namespace swingrisk
