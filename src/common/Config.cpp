#include "common/Config.h"
#include "common/Errors.h"
#include "common/PathUtils.h"

#include <filesystem>
#include <fstream>
#include <iostream>

namespace swingrisk {

namespace {
std::array<double, kProfitLevelCount> readTriple(
    const nlohmann::json& j,
    const char* key,
    const std::array<double, kProfitLevelCount>& fallback,
    const std::string& section
) {
    if (!j.contains(key)) {
        return fallback;
    }
    const auto values = j.at(key).get<std::vector<double>>();
    if (values.size() != kProfitLevelCount) {
        throw ConfigError(section + "." + key + " must have exactly 3 values");
    }
    return {{values[0], values[1], values[2]}};
}

analytics::RegimeBands readBands(const nlohmann::json& j, const analytics::RegimeBands& fallback) {
    analytics::RegimeBands bands;
    bands.bull_normal_min = j.value("bull_normal_min", fallback.bull_normal_min);
    bands.high_vol_min = j.value("high_vol_min", fallback.high_vol_min);
    bands.crisis_min = j.value("crisis_min", fallback.crisis_min);
    return bands;
}

risk::RegimeConfig readRegime(const nlohmann::json& r, const risk::RegimeConfig& fallback, const std::string& name) {
    risk::RegimeConfig c = fallback;
    c.stop_loss_pct = r.value("stop_loss_pct", fallback.stop_loss_pct);
    c.profit_levels_pct = readTriple(r, "profit_levels", fallback.profit_levels_pct, name);
    c.position_scaling_pct = readTriple(r, "position_scaling", fallback.position_scaling_pct, name);
    c.tr_stop_multiplier = r.value("tr_stop_multiplier", fallback.tr_stop_multiplier);
    c.tr_profit_multipliers = readTriple(r, "tr_profit_multipliers", fallback.tr_profit_multipliers, name);
    c.max_hold_days = r.value("max_hold_days", fallback.max_hold_days);
    c.description = r.value("description", fallback.description);
    return c;
}
}

Config& Config::getInstance() {
    static Config instance;
    return instance;
}

Config::Config() {
    resetToDefaults();
}

void Config::resetToDefaults() {
    log_level_ = "info";
    log_dir_ = "logs";
    regime_bands_ = analytics::RegimeBands();
    regime_configs_ = risk::RegimeConfigTable::defaults();
    backtest_config_ = backtest::BacktestConfig();
    grid_space_ = backtest::GridSearchSpace::defaults();
    alert_config_ = engine::AlertConfig();
}

void Config::load(const std::string& path) {
    const std::filesystem::path config_path = utils::PathUtils::findExistingPath(path);

    std::cerr << "설정 파일 경로: " << config_path << std::endl;

    if (!std::filesystem::exists(config_path)) {
        std::cerr << "경고: 설정 파일을 찾을 수 없습니다: " << config_path << std::endl;
        std::cerr << "기본값을 사용합니다." << std::endl;
        return;
    }

    std::ifstream file(config_path);
    if (!file.is_open()) {
        throw ConfigError("cannot open " + config_path.string());
    }

    nlohmann::json j;
    try {
        file >> j;
    } catch (const nlohmann::json::exception& e) {
        throw ConfigError(config_path.string() + ": " + e.what());
    }
    loadFromJson(j);
}

void Config::loadFromJson(const nlohmann::json& j) {
    if (!j.is_object()) {
        throw ConfigError("top-level value must be an object");
    }

    // 검증이 끝난 뒤에만 반영
    std::string log_level = log_level_;
    std::string log_dir = log_dir_;
    analytics::RegimeBands bands = regime_bands_;
    risk::RegimeConfigTable configs = regime_configs_;
    backtest::BacktestConfig backtest = backtest_config_;
    backtest::GridSearchSpace grid = grid_space_;
    engine::AlertConfig alerts = alert_config_;

    try {
        if (j.contains("logging")) {
            auto& l = j["logging"];
            log_level = l.value("level", log_level);
            log_dir = l.value("dir", log_dir);
        }

        if (j.contains("classifier")) {
            bands = readBands(j["classifier"], bands);
            if (!bands.isValid()) {
                throw ConfigError("classifier band edges must be positive and strictly ascending");
            }
        }

        if (j.contains("regimes")) {
            for (auto it = j["regimes"].begin(); it != j["regimes"].end(); ++it) {
                const auto regime = regimeFromString(it.key());
                if (!regime) {
                    throw ConfigError("unknown regime: " + it.key());
                }
                configs.set(*regime, readRegime(it.value(), configs.at(*regime), it.key()));
            }
            configs.validate();
        }

        if (j.contains("backtest")) {
            auto& b = j["backtest"];
            backtest.baseline_hold_days = b.value("baseline_hold_days", backtest.baseline_hold_days);
            backtest.workers = b.value("workers", backtest.workers);
            if (backtest.baseline_hold_days < 1) {
                throw ConfigError("backtest.baseline_hold_days must be >= 1");
            }
            if (backtest.workers < 0) {
                throw ConfigError("backtest.workers must be >= 0");
            }

            if (b.contains("grid")) {
                auto& g = b["grid"];
                if (g.contains("vix_bands")) {
                    grid.vix_bands.clear();
                    for (const auto& edges : g["vix_bands"]) {
                        const auto values = edges.get<std::vector<double>>();
                        if (values.size() != 3) {
                            throw ConfigError("backtest.grid.vix_bands entries must have 3 edges");
                        }
                        grid.vix_bands.push_back(analytics::RegimeBands{values[0], values[1], values[2]});
                    }
                }
                if (g.contains("stop_scalars")) {
                    grid.stop_scalars = g["stop_scalars"].get<std::vector<double>>();
                }
                if (g.contains("profit_scalars")) {
                    grid.profit_scalars = g["profit_scalars"].get<std::vector<double>>();
                }
            }
        }

        if (j.contains("alerts")) {
            auto& a = j["alerts"];
            alerts.max_drawdown_pct = a.value("max_drawdown_pct", alerts.max_drawdown_pct);
            alerts.position_concentration_pct = a.value("position_concentration_pct", alerts.position_concentration_pct);
            if (alerts.max_drawdown_pct >= 0.0) {
                throw ConfigError("alerts.max_drawdown_pct must be negative");
            }
            if (alerts.position_concentration_pct <= 0.0 || alerts.position_concentration_pct > 100.0) {
                throw ConfigError("alerts.position_concentration_pct must be within (0, 100]");
            }
        }
    } catch (const nlohmann::json::exception& e) {
        throw ConfigError(e.what());
    }

    log_level_ = log_level;
    log_dir_ = log_dir;
    regime_bands_ = bands;
    regime_configs_ = configs;
    backtest_config_ = backtest;
    grid_space_ = grid;
    alert_config_ = alerts;

    std::cerr << "설정 로드 완료 (log level: " << log_level_ << ")" << std::endl;
}

} // namespace swingrisk
