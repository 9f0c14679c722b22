#pragma once

#include "risk/RegimeConfig.h"
#include <string>
#include <vector>

namespace swingrisk {
namespace risk {

struct ProfitTarget {
    int level = 0;                    // 1-based
    double price = 0.0;
    double pct = 0.0;                 // 진입가 대비 (%)
    double position_to_close = 0.0;   // 이 레벨에서 청산할 비율 (%)
    double cumulative_closed = 0.0;   // 누적 청산 비율 (%)
    std::string method;               // "tr_based" | "pct_based"
};

// 3단계 분할 익절 스케줄
class ProfitLadderEngine {
public:
    std::vector<ProfitTarget> calculate(
        double entry_price,
        const RegimeConfig& config,
        double current_true_range
    ) const;
};

} // namespace risk
} // namespace swingrisk
