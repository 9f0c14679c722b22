#pragma once

#include <array>
#include <cstddef>
#include <optional>
#include <string>

namespace swingrisk {

using Price = double;

// 시장 레짐 (VIX 밴드 오름차순)
enum class RegimeType {
    LOW_VOL_COMPLACENCY,
    BULL_NORMAL,
    HIGH_VOL_STRESS,
    CRISIS_OPPORTUNITY
};

constexpr std::size_t kRegimeCount = 4;
constexpr std::size_t kProfitLevelCount = 3;

inline std::size_t regimeIndex(RegimeType regime) {
    return static_cast<std::size_t>(regime);
}

inline const char* regimeToString(RegimeType regime) {
    switch (regime) {
        case RegimeType::LOW_VOL_COMPLACENCY: return "low_vol_complacency";
        case RegimeType::BULL_NORMAL: return "bull_normal";
        case RegimeType::HIGH_VOL_STRESS: return "high_vol_stress";
        case RegimeType::CRISIS_OPPORTUNITY: return "crisis_opportunity";
    }
    return "unknown";
}

inline std::optional<RegimeType> regimeFromString(const std::string& name) {
    if (name == "low_vol_complacency") return RegimeType::LOW_VOL_COMPLACENCY;
    if (name == "bull_normal") return RegimeType::BULL_NORMAL;
    if (name == "high_vol_stress") return RegimeType::HIGH_VOL_STRESS;
    if (name == "crisis_opportunity") return RegimeType::CRISIS_OPPORTUNITY;
    return std::nullopt;
}

constexpr std::array<RegimeType, kRegimeCount> kAllRegimes = {
    RegimeType::LOW_VOL_COMPLACENCY,
    RegimeType::BULL_NORMAL,
    RegimeType::HIGH_VOL_STRESS,
    RegimeType::CRISIS_OPPORTUNITY
};

// 관측 1회분 시장 상태. 생성 후 변경하지 않는다.
struct MarketSnapshot {
    double vix = 0.0;
    std::optional<double> t2108;          // breadth percentile 0~100
    std::optional<double> momentum_ratio;
    std::optional<double> true_range;     // 종목 True Range (없으면 진입가 2%)
    int day = 0;

    MarketSnapshot() = default;
    MarketSnapshot(double v,
                   std::optional<double> breadth = std::nullopt,
                   std::optional<double> momentum = std::nullopt,
                   int d = 0)
        : vix(v), t2108(breadth), momentum_ratio(momentum), day(d) {}
};

struct DailyBar {
    double high;
    double low;
    double close;
    std::optional<double> vix;
    std::optional<double> t2108;
    std::optional<double> momentum_ratio;

    DailyBar() : high(0), low(0), close(0) {}

    DailyBar(double h, double l, double c)
        : high(h), low(l), close(c) {}
};

} // namespace swingrisk
