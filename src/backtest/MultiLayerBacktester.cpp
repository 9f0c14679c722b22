#include "backtest/MultiLayerBacktester.h"
#include "analytics/TechnicalIndicators.h"
#include "common/Errors.h"
#include "common/Logger.h"

#include <algorithm>
#include <cmath>
#include <exception>
#include <thread>

namespace swingrisk {
namespace backtest {

namespace {
bool isPositiveFinite(double v) {
    return std::isfinite(v) && v > 0.0;
}

MarketSnapshot entrySnapshot(const HistoricalTrade& trade) {
    MarketSnapshot snapshot(trade.vix_at_entry, trade.t2108, trade.momentum_ratio, trade.entry_day);
    if (trade.true_range) {
        snapshot.true_range = trade.true_range;
    } else {
        // 진입가를 전일 종가로 본 첫 봉의 True Range
        const DailyBar& first = trade.bars.front();
        snapshot.true_range = analytics::TechnicalIndicators::calculateTrueRange(first, trade.entry_price);
        if (!(*snapshot.true_range > 0.0)) {
            snapshot.true_range.reset();
        }
    }
    return snapshot;
}

// 일봉에 값이 없으면 진입 시점 값을 그대로 쓴다
MarketSnapshot barSnapshot(const HistoricalTrade& trade, const DailyBar& bar, int day) {
    return MarketSnapshot(
        bar.vix.value_or(trade.vix_at_entry),
        bar.t2108 ? bar.t2108 : trade.t2108,
        bar.momentum_ratio ? bar.momentum_ratio : trade.momentum_ratio,
        day);
}
} // namespace

const LayerReport& ComparativeReport::layer(BacktestLayer which) const {
    for (const auto& report : layers) {
        if (report.layer == which) {
            return report;
        }
    }
    throw InvalidInput(std::string("layer not in report: ") + backtestLayerToString(which));
}

GridSearchSpace GridSearchSpace::defaults() {
    GridSearchSpace space;
    space.vix_bands = {
        analytics::RegimeBands{15.0, 30.0, 50.0},
        analytics::RegimeBands{12.0, 25.0, 45.0},
        analytics::RegimeBands{18.0, 35.0, 55.0}
    };
    space.stop_scalars = {0.8, 1.0, 1.2};
    space.profit_scalars = {0.8, 1.0, 1.2};
    return space;
}

MultiLayerBacktester::MultiLayerBacktester(
    const risk::RegimeConfigTable& configs,
    const analytics::RegimeClassifier& classifier,
    const BacktestConfig& config
)
    : configs_(configs)
    , classifier_(classifier)
    , config_(config)
{
    configs_.validate();
    if (config_.baseline_hold_days < 1) {
        throw ConfigError("baseline_hold_days must be >= 1");
    }
    if (config_.workers < 0) {
        throw ConfigError("workers must be >= 0");
    }
}

void MultiLayerBacktester::validateTrades(const std::vector<HistoricalTrade>& trades) {
    for (std::size_t i = 0; i < trades.size(); ++i) {
        const HistoricalTrade& t = trades[i];
        const std::string where = "trade #" + std::to_string(i) + " (" + t.symbol + ")";

        if (t.symbol.empty()) {
            throw InvalidInput(where + ": empty symbol");
        }
        if (!isPositiveFinite(t.entry_price)) {
            throw InvalidInput(where + ": entry price must be positive");
        }
        if (!isPositiveFinite(t.vix_at_entry)) {
            throw InvalidInput(where + ": vix must be positive");
        }
        if (t.true_range && !isPositiveFinite(*t.true_range)) {
            throw InvalidInput(where + ": true range must be positive");
        }
        if (t.bars.empty()) {
            throw InvalidInput(where + ": no daily bars");
        }
        for (std::size_t d = 0; d < t.bars.size(); ++d) {
            const DailyBar& bar = t.bars[d];
            if (!isPositiveFinite(bar.high) || !isPositiveFinite(bar.low) ||
                !isPositiveFinite(bar.close) || bar.low > bar.high) {
                throw InvalidInput(where + ": malformed bar on day " + std::to_string(d + 1));
            }
        }
        risk::PositionLifecycle::validateSnapshot(entrySnapshot(t));
        for (std::size_t d = 0; d < t.bars.size(); ++d) {
            risk::PositionLifecycle::validateSnapshot(barSnapshot(t, t.bars[d], t.entry_day + static_cast<int>(d) + 1));
        }
    }
}

double MultiLayerBacktester::compositeScore(const engine::PerformanceSummary& p) {
    const double max_dd = std::fabs(p.max_drawdown);
    if (max_dd > 0.0 && p.sharpe_ratio > 0.0) {
        return (p.annualized_roi / max_dd) * p.sharpe_ratio;
    }
    return p.annualized_roi;
}

risk::RuleSet MultiLayerBacktester::rulesFor(BacktestLayer layer, int baseline_hold_days) {
    risk::RuleSet rules;
    switch (layer) {
        case BacktestLayer::BASELINE: rules = risk::RuleSet::baseline(baseline_hold_days); break;
        case BacktestLayer::STOP_ONLY: rules = risk::RuleSet::stopOnly(); break;
        case BacktestLayer::PROFIT_ONLY: rules = risk::RuleSet::profitOnly(); break;
        case BacktestLayer::COMBINED: rules = risk::RuleSet::all(); break;
    }
    // 규칙이 발동하지 않으면 baseline과 같은 날 같은 가격으로 청산
    rules.fixed_hold_days = baseline_hold_days;
    // 시뮬레이션 체결은 trades.log에 남기지 않음
    rules.log_trades = false;
    return rules;
}

risk::ClosedTrade MultiLayerBacktester::simulateTrade(
    risk::PositionLifecycle& lifecycle,
    const HistoricalTrade& trade
) const {
    // 거래 간 전환 비교 없음
    lifecycle.resetMarketContext();
    lifecycle.open(trade.symbol, trade.entry_price, entrySnapshot(trade));

    for (std::size_t d = 0; d < trade.bars.size(); ++d) {
        const DailyBar& bar = trade.bars[d];
        const int day = trade.entry_day + static_cast<int>(d) + 1;
        risk::UpdateResult result = lifecycle.update(
            trade.symbol, bar.high, bar.low, bar.close, barSnapshot(trade, bar, day));
        if (result.closed_trade) {
            return *result.closed_trade;
        }
    }

    std::optional<risk::ClosedTrade> closed =
        lifecycle.closePosition(trade.symbol, trade.bars.back().close, "end_of_data");
    if (!closed) {
        throw RiskError("position vanished before end of data: " + trade.symbol);
    }
    return *closed;
}

LayerReport MultiLayerBacktester::replay(
    BacktestLayer layer,
    const std::vector<HistoricalTrade>& trades,
    const risk::RegimeConfigTable& configs,
    const analytics::RegimeClassifier& classifier
) const {
    risk::PositionLifecycle lifecycle(configs, classifier, rulesFor(layer, config_.baseline_hold_days));

    LayerReport report;
    report.layer = layer;
    report.trades.reserve(trades.size());
    for (const auto& trade : trades) {
        risk::ClosedTrade closed = simulateTrade(lifecycle, trade);
        report.exit_reason_counts[closed.exit_reason]++;
        report.trades.push_back(std::move(closed));
    }

    report.performance = engine::PerformanceAggregator::summarize(report.trades);
    report.composite_score = compositeScore(report.performance);
    return report;
}

LayerReport MultiLayerBacktester::runLayer(BacktestLayer layer, const std::vector<HistoricalTrade>& trades) const {
    validateTrades(trades);
    return replay(layer, trades, configs_, classifier_);
}

ComparativeReport MultiLayerBacktester::run(const std::vector<HistoricalTrade>& trades) const {
    validateTrades(trades);

    ComparativeReport report;
    report.trade_count = static_cast<int>(trades.size());
    for (BacktestLayer layer : {BacktestLayer::BASELINE, BacktestLayer::STOP_ONLY,
                                BacktestLayer::PROFIT_ONLY, BacktestLayer::COMBINED}) {
        report.layers.push_back(replay(layer, trades, configs_, classifier_));
    }

    const LayerReport& baseline = report.layers.front();
    for (auto& layer : report.layers) {
        layer.incremental_return = layer.performance.total_return - baseline.performance.total_return;
        layer.drawdown_reduction = std::fabs(baseline.performance.max_drawdown) -
                                   std::fabs(layer.performance.max_drawdown);
    }

    std::vector<const LayerReport*> ordered;
    for (const auto& layer : report.layers) {
        ordered.push_back(&layer);
    }
    std::stable_sort(ordered.begin(), ordered.end(), [](const LayerReport* a, const LayerReport* b) {
        return a->composite_score > b->composite_score;
    });
    for (const auto* layer : ordered) {
        report.ranking.push_back(layer->layer);
    }

    LOG_INFO("Backtest finished: {} trades, best layer {} (score {:.3f})",
             report.trade_count, backtestLayerToString(report.best()), ordered.front()->composite_score);
    for (const auto& layer : report.layers) {
        LOG_INFO("  {:<12} total {:+.2f}% | win {:.1f}% | sharpe {:.2f} | maxDD {:.2f}% | score {:.3f}",
                 backtestLayerToString(layer.layer),
                 layer.performance.total_return * 100.0,
                 layer.performance.win_rate * 100.0,
                 layer.performance.sharpe_ratio,
                 layer.performance.max_drawdown * 100.0,
                 layer.composite_score);
    }
    return report;
}

OptimizationResult MultiLayerBacktester::optimize(
    const std::vector<HistoricalTrade>& trades,
    const GridSearchSpace& space
) const {
    validateTrades(trades);

    OptimizationResult result;
    std::vector<GridCandidate> candidates;
    candidates.reserve(space.size());
    for (const auto& bands : space.vix_bands) {
        for (double stop_scalar : space.stop_scalars) {
            for (double profit_scalar : space.profit_scalars) {
                if (!bands.isValid() || !isPositiveFinite(stop_scalar) || !isPositiveFinite(profit_scalar)) {
                    result.skipped_candidates++;
                    continue;
                }
                GridCandidate candidate;
                candidate.bands = bands;
                candidate.stop_scalar = stop_scalar;
                candidate.profit_scalar = profit_scalar;
                candidates.push_back(candidate);
            }
        }
    }

    if (candidates.empty()) {
        LOG_WARN("Grid search: no valid candidates ({} skipped)", result.skipped_candidates);
        return result;
    }

    std::size_t worker_count = (config_.workers > 0)
        ? static_cast<std::size_t>(config_.workers)
        : std::max<std::size_t>(1, std::thread::hardware_concurrency());
    worker_count = std::min(worker_count, candidates.size());

    std::vector<CandidateScore> scores(candidates.size());
    std::vector<std::exception_ptr> errors(worker_count);
    std::vector<std::thread> workers;
    workers.reserve(worker_count);

    for (std::size_t w = 0; w < worker_count; ++w) {
        workers.emplace_back([&, w]() {
            try {
                for (std::size_t i = w; i < candidates.size(); i += worker_count) {
                    const GridCandidate& c = candidates[i];
                    const risk::RegimeConfigTable configs = configs_.scaled(c.stop_scalar, c.profit_scalar);
                    const LayerReport layer = replay(BacktestLayer::COMBINED, trades, configs,
                                                     analytics::RegimeClassifier(c.bands));
                    scores[i].candidate = c;
                    scores[i].composite_score = layer.composite_score;
                    scores[i].performance = layer.performance;
                }
            } catch (const std::exception&) {
                errors[w] = std::current_exception();
            }
        });
    }
    for (auto& t : workers) {
        t.join();
    }
    for (const auto& error : errors) {
        if (error) {
            std::rethrow_exception(error);
        }
    }

    // 동점이면 먼저 나온 후보 유지
    std::size_t best_index = 0;
    for (std::size_t i = 1; i < scores.size(); ++i) {
        if (scores[i].composite_score > scores[best_index].composite_score) {
            best_index = i;
        }
    }

    result.found = true;
    result.best = scores[best_index];
    result.evaluated = std::move(scores);

    const GridCandidate& best = result.best.candidate;
    LOG_INFO("Grid search: {} candidates on {} workers, best bands {:.1f}/{:.1f}/{:.1f} stop x{:.2f} profit x{:.2f} (score {:.3f})",
             result.evaluated.size(), worker_count,
             best.bands.bull_normal_min, best.bands.high_vol_min, best.bands.crisis_min,
             best.stop_scalar, best.profit_scalar, result.best.composite_score);
    return result;
}

} // namespace backtest
} // namespace swingrisk
