#pragma once

namespace swingrisk {
namespace engine {

// Portfolio alert thresholds (percent)
struct AlertConfig {
    double max_drawdown_pct = -15.0;
    double position_concentration_pct = 25.0;
};

// 파사드 경계 검증 범위
struct BoundaryLimits {
    double min_vix = 5.0;
    double max_vix = 100.0;
};

} // namespace engine
} // namespace swingrisk
