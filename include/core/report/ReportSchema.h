#pragma once

#include <nlohmann/json.hpp>

#include "backtest/MultiLayerBacktester.h"
#include "engine/PerformanceAggregator.h"
#include "engine/RiskEngine.h"
#include "risk/PositionLifecycle.h"

namespace swingrisk {
namespace core {
namespace report {

nlohmann::json toJson(const risk::ProfitTarget& target);
nlohmann::json toJson(const risk::PositionAction& action);
nlohmann::json toJson(const risk::ClosedTrade& trade);
nlohmann::json toJson(const risk::UpdateResult& result);

nlohmann::json toJson(const engine::PerformanceSummary& summary);
nlohmann::json toJson(const engine::OpenPositionResult& result);
nlohmann::json toJson(const engine::PortfolioPerformance& performance);
nlohmann::json toJson(const engine::PositionUpdateResult& result);
nlohmann::json toJson(const engine::PortfolioAlert& alert);

nlohmann::json toJson(const backtest::LayerReport& layer);
nlohmann::json toJson(const backtest::ComparativeReport& report);
nlohmann::json toJson(const backtest::OptimizationResult& result);

// Throws InvalidInput on missing/mistyped fields
backtest::HistoricalTrade historicalTradeFromJson(const nlohmann::json& j);
nlohmann::json toJson(const backtest::HistoricalTrade& trade);

} // namespace report
} // namespace core
} // namespace swingrisk
