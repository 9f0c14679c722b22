#pragma once

#include "common/Types.h"
#include <optional>
#include <string>

namespace swingrisk {
namespace analytics {

// Lower VIX edges of BULL_NORMAL, HIGH_VOL_STRESS and CRISIS_OPPORTUNITY.
// Bands are half-open: [0, bull) [bull, stress) [stress, crisis) [crisis, inf)
struct RegimeBands {
    double bull_normal_min = 15.0;
    double high_vol_min = 30.0;
    double crisis_min = 50.0;

    bool isValid() const {
        return bull_normal_min > 0.0 && high_vol_min > bull_normal_min && crisis_min > high_vol_min;
    }
};

struct RegimeAnalysis {
    RegimeType regime = RegimeType::BULL_NORMAL;
    RegimeType primary_regime = RegimeType::BULL_NORMAL;  // VIX 밴드만으로 분류한 결과
    bool secondary_adjusted = false;
    double confidence = 0.0;
    std::string description;
};

class RegimeClassifier {
public:
    RegimeClassifier() = default;
    explicit RegimeClassifier(const RegimeBands& bands) : bands_(bands) {}

    RegimeType classify(double vix,
                        std::optional<double> t2108 = std::nullopt,
                        std::optional<double> momentum_ratio = std::nullopt) const;

    RegimeType classify(const MarketSnapshot& snapshot) const {
        return classify(snapshot.vix, snapshot.t2108, snapshot.momentum_ratio);
    }

    RegimeAnalysis analyze(const MarketSnapshot& snapshot) const;

    RegimeType classifyByVix(double vix) const;
    const RegimeBands& bands() const { return bands_; }

private:
    // Confidence is highest at extreme VIX where the regime is unambiguous
    static double classificationConfidence(double vix);

    RegimeBands bands_;
};

} // namespace analytics
} // namespace swingrisk
