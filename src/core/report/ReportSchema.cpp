#include "core/report/ReportSchema.h"
#include "common/Errors.h"

namespace swingrisk {
namespace core {
namespace report {

namespace {
nlohmann::json optionalToJson(const std::optional<double>& v) {
    return v ? nlohmann::json(*v) : nlohmann::json(nullptr);
}

std::optional<double> optionalFromJson(const nlohmann::json& j, const char* key) {
    if (!j.contains(key) || j.at(key).is_null()) {
        return std::nullopt;
    }
    return j.at(key).get<double>();
}

nlohmann::json bandsToJson(const analytics::RegimeBands& bands) {
    nlohmann::json out;
    out["bull_normal_min"] = bands.bull_normal_min;
    out["high_vol_min"] = bands.high_vol_min;
    out["crisis_min"] = bands.crisis_min;
    return out;
}

nlohmann::json candidateScoreToJson(const backtest::CandidateScore& score) {
    nlohmann::json out;
    out["vix_bands"] = bandsToJson(score.candidate.bands);
    out["stop_scalar"] = score.candidate.stop_scalar;
    out["profit_scalar"] = score.candidate.profit_scalar;
    out["composite_score"] = score.composite_score;
    out["performance"] = toJson(score.performance);
    return out;
}
}

nlohmann::json toJson(const risk::ProfitTarget& target) {
    nlohmann::json out;
    out["level"] = target.level;
    out["price"] = target.price;
    out["pct"] = target.pct;
    out["position_to_close"] = target.position_to_close;
    out["cumulative_closed"] = target.cumulative_closed;
    out["method"] = target.method;
    return out;
}

nlohmann::json toJson(const risk::PositionAction& action) {
    nlohmann::json out;
    out["day"] = action.day;
    out["type"] = risk::actionTypeToString(action.type);
    if (action.type == risk::ActionType::PROFIT_TAKING) {
        out["level"] = action.level;
    }
    out["price"] = action.price;
    out["position_affected"] = action.position_affected;
    out["pnl_impact"] = action.pnl_impact;
    out["detail"] = action.detail;
    return out;
}

nlohmann::json toJson(const risk::ClosedTrade& trade) {
    nlohmann::json out;
    out["symbol"] = trade.symbol;
    out["regime_at_entry"] = regimeToString(trade.regime_at_entry);
    out["entry_price"] = trade.entry_price;
    out["exit_price"] = trade.exit_price;
    out["position_size_pct"] = trade.position_size_pct;
    out["realized_return"] = trade.realized_return;
    out["days_held"] = trade.days_held;
    out["exit_reason"] = trade.exit_reason;
    out["profit_levels_hit"] = trade.profit_levels_hit;
    out["stop_triggered"] = trade.stop_triggered;
    out["max_profit_seen"] = trade.max_profit_seen;
    out["max_loss_seen"] = trade.max_loss_seen;
    return out;
}

nlohmann::json toJson(const risk::UpdateResult& result) {
    nlohmann::json out;
    out["symbol"] = result.symbol;
    out["status"] = risk::positionStateToString(result.status);
    out["actions"] = nlohmann::json::array();
    for (const auto& action : result.actions) {
        out["actions"].push_back(toJson(action));
    }
    out["current_pnl"] = optionalToJson(result.current_pnl);
    out["realized_pnl"] = result.realized_pnl;
    out["remaining_pct"] = result.remaining_pct;
    out["days_held"] = result.days_held;
    if (result.closed_trade) {
        out["closed_trade"] = toJson(*result.closed_trade);
    }
    return out;
}

nlohmann::json toJson(const engine::PerformanceSummary& s) {
    nlohmann::json out;
    out["total_trades"] = s.total_trades;
    out["total_return"] = s.total_return;
    out["average_return"] = s.average_return;
    out["win_rate"] = s.win_rate;
    out["max_win"] = s.max_win;
    out["max_loss"] = s.max_loss;
    out["volatility"] = s.volatility;
    out["sharpe_ratio"] = s.sharpe_ratio;
    out["current_drawdown"] = s.current_drawdown;
    out["max_drawdown"] = s.max_drawdown;
    out["annualized_roi"] = s.annualized_roi;
    out["calmar_ratio"] = s.calmar_ratio;

    nlohmann::json by_regime = nlohmann::json::object();
    for (const auto& [regime, stats] : s.by_regime) {
        by_regime[regimeToString(regime)] = {
            {"trades", stats.trades},
            {"wins", stats.wins},
            {"total_return", stats.total_return},
            {"average_return", stats.averageReturn()},
            {"win_rate", stats.winRate()}
        };
    }
    out["by_regime"] = by_regime;
    return out;
}

nlohmann::json toJson(const engine::OpenPositionResult& r) {
    nlohmann::json out;
    out["symbol"] = r.symbol;
    out["regime"] = regimeToString(r.regime);
    out["regime_confidence"] = r.regime_confidence;
    out["entry_price"] = r.entry_price;
    out["position_size_pct"] = r.position_size_pct;
    out["stop_level"] = r.stop_level;
    out["stop_distance_pct"] = r.stop_distance_pct;
    out["stop_method"] = r.stop_method;
    out["true_range"] = r.true_range;
    out["profit_targets"] = nlohmann::json::array();
    for (const auto& target : r.profit_targets) {
        out["profit_targets"].push_back(toJson(target));
    }
    out["expected_hold_days"] = r.expected_hold_days;
    out["transition_detected"] = r.transition_detected;
    out["adjustment_reason"] = r.adjustment_reason;
    out["risk_score"] = r.risk_score;
    return out;
}

nlohmann::json toJson(const engine::PortfolioPerformance& p) {
    nlohmann::json out = toJson(p.performance);
    out["active_positions"] = p.active_positions;
    out["regime_distribution"] = nlohmann::json::object();
    for (const auto& [regime, count] : p.regime_distribution) {
        out["regime_distribution"][regimeToString(regime)] = count;
    }
    out["risk_adjusted_metrics"] = {
        {"calmar_ratio", p.performance.calmar_ratio},
        {"sortino_ratio", p.risk_adjusted.sortino_ratio},
        {"max_win_to_max_loss_ratio", p.risk_adjusted.win_loss_ratio}
    };
    out["performance_trend"] = engine::performanceTrendToString(p.trend);
    return out;
}

nlohmann::json toJson(const engine::PositionUpdateResult& result) {
    nlohmann::json out = toJson(result.update);
    out["pre_update_analysis"] = {
        {"current_pnl_pct", result.pre_update.current_pnl_pct},
        {"days_held", result.pre_update.days_held},
        {"stop_distance", result.pre_update.stop_distance},
        {"regime_change_detected", result.pre_update.regime_change_detected}
    };
    out["regime_stability"] = engine::regimeStabilityToString(result.regime_stability);
    out["position_health"] = engine::positionHealthToString(result.position_health);
    return out;
}

nlohmann::json toJson(const engine::PortfolioAlert& alert) {
    nlohmann::json out;
    out["type"] = engine::alertTypeToString(alert.type);
    if (!alert.symbol.empty()) {
        out["symbol"] = alert.symbol;
    }
    out["value"] = alert.value;
    out["threshold"] = alert.threshold;
    out["message"] = alert.message;
    return out;
}

nlohmann::json toJson(const backtest::LayerReport& layer) {
    nlohmann::json out;
    out["layer"] = backtest::backtestLayerToString(layer.layer);
    out["performance"] = toJson(layer.performance);
    out["composite_score"] = layer.composite_score;
    out["incremental_return"] = layer.incremental_return;
    out["drawdown_reduction"] = layer.drawdown_reduction;
    out["exit_reasons"] = layer.exit_reason_counts;
    return out;
}

nlohmann::json toJson(const backtest::ComparativeReport& report) {
    nlohmann::json out;
    out["trade_count"] = report.trade_count;
    out["layers"] = nlohmann::json::array();
    for (const auto& layer : report.layers) {
        out["layers"].push_back(toJson(layer));
    }
    out["ranking"] = nlohmann::json::array();
    for (auto layer : report.ranking) {
        out["ranking"].push_back(backtest::backtestLayerToString(layer));
    }
    if (!report.ranking.empty()) {
        out["best_layer"] = backtest::backtestLayerToString(report.best());
    }
    return out;
}

nlohmann::json toJson(const backtest::OptimizationResult& result) {
    nlohmann::json out;
    out["found"] = result.found;
    out["evaluated_candidates"] = result.evaluated.size();
    out["skipped_candidates"] = result.skipped_candidates;
    if (result.found) {
        out["best"] = candidateScoreToJson(result.best);
    }
    return out;
}

backtest::HistoricalTrade historicalTradeFromJson(const nlohmann::json& j) {
    if (!j.is_object()) {
        throw InvalidInput("historical trade must be an object");
    }

    backtest::HistoricalTrade trade;
    try {
        trade.symbol = j.at("symbol").get<std::string>();
        trade.entry_price = j.at("entry_price").get<double>();
        trade.entry_day = j.value("entry_day", 0);
        trade.vix_at_entry = j.at("vix").get<double>();
        trade.t2108 = optionalFromJson(j, "t2108");
        trade.momentum_ratio = optionalFromJson(j, "momentum_ratio");
        trade.true_range = optionalFromJson(j, "true_range");

        for (const auto& b : j.at("bars")) {
            DailyBar bar(b.at("high").get<double>(), b.at("low").get<double>(), b.at("close").get<double>());
            bar.vix = optionalFromJson(b, "vix");
            bar.t2108 = optionalFromJson(b, "t2108");
            bar.momentum_ratio = optionalFromJson(b, "momentum_ratio");
            trade.bars.push_back(bar);
        }
    } catch (const nlohmann::json::exception& e) {
        throw InvalidInput(std::string("historical trade: ") + e.what());
    }
    return trade;
}

nlohmann::json toJson(const backtest::HistoricalTrade& trade) {
    nlohmann::json out;
    out["symbol"] = trade.symbol;
    out["entry_price"] = trade.entry_price;
    out["entry_day"] = trade.entry_day;
    out["vix"] = trade.vix_at_entry;
    out["t2108"] = optionalToJson(trade.t2108);
    out["momentum_ratio"] = optionalToJson(trade.momentum_ratio);
    out["true_range"] = optionalToJson(trade.true_range);
    out["bars"] = nlohmann::json::array();
    for (const auto& bar : trade.bars) {
        nlohmann::json b;
        b["high"] = bar.high;
        b["low"] = bar.low;
        b["close"] = bar.close;
        if (bar.vix) b["vix"] = *bar.vix;
        if (bar.t2108) b["t2108"] = *bar.t2108;
        if (bar.momentum_ratio) b["momentum_ratio"] = *bar.momentum_ratio;
        out["bars"].push_back(b);
    }
    return out;
}

} // namespace report
} // namespace core
} // namespace swingrisk
