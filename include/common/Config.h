#pragma once

#include <string>
#include <nlohmann/json.hpp>
#include "analytics/RegimeClassifier.h"
#include "backtest/MultiLayerBacktester.h"
#include "engine/RiskEngineConfig.h"
#include "risk/RegimeConfig.h"

namespace swingrisk {

class Config {
public:
    static Config& getInstance();

    // 파일이 없으면 기본값 유지, 형식 오류면 ConfigError
    void load(const std::string& config_path);
    void loadFromJson(const nlohmann::json& j);
    void resetToDefaults();

    std::string getLogLevel() const { return log_level_; }
    std::string getLogDir() const { return log_dir_; }

    const analytics::RegimeBands& getRegimeBands() const { return regime_bands_; }
    const risk::RegimeConfigTable& getRegimeConfigs() const { return regime_configs_; }
    const backtest::BacktestConfig& getBacktestConfig() const { return backtest_config_; }
    const backtest::GridSearchSpace& getGridSearchSpace() const { return grid_space_; }
    const engine::AlertConfig& getAlertConfig() const { return alert_config_; }

private:
    Config();

    std::string log_level_ = "info";
    std::string log_dir_ = "logs";

    analytics::RegimeBands regime_bands_;
    risk::RegimeConfigTable regime_configs_;
    backtest::BacktestConfig backtest_config_;
    backtest::GridSearchSpace grid_space_;
    engine::AlertConfig alert_config_;
};

} // namespace swingrisk
