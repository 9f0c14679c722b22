#include "common/Config.h"
#include "common/Errors.h"
#include "engine/RiskEngine.h"
#include <cassert>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <iostream>

using namespace swingrisk;

namespace {
bool approx(double a, double b, double eps = 1e-9) {
    return std::fabs(a - b) < eps;
}

std::filesystem::path writeTemp(const std::string& name, const std::string& content) {
    auto path = std::filesystem::temp_directory_path() / name;
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out << content;
    return path;
}

template<typename F>
bool throwsConfigError(F&& fn) {
    try {
        fn();
    } catch (const ConfigError&) {
        return true;
    }
    return false;
}

void testDefaults() {
    Config& config = Config::getInstance();
    config.resetToDefaults();

    assert(config.getLogLevel() == "info");
    assert(approx(config.getRegimeBands().bull_normal_min, 15.0));
    assert(approx(config.getRegimeConfigs().at(RegimeType::CRISIS_OPPORTUNITY).stop_loss_pct, -15.0));
    assert(config.getRegimeConfigs().at(RegimeType::LOW_VOL_COMPLACENCY).max_hold_days == 2);
    assert(config.getBacktestConfig().baseline_hold_days == 5);
    assert(config.getGridSearchSpace().size() == 27);
    assert(approx(config.getAlertConfig().max_drawdown_pct, -15.0));
    assert(approx(config.getAlertConfig().position_concentration_pct, 25.0));
}

void testLoadOverrides() {
    Config& config = Config::getInstance();
    config.resetToDefaults();

    auto path = writeTemp("swingrisk_config_test.json", R"({
        "logging": {"level": "debug", "dir": "/tmp/swingrisk_logs"},
        "classifier": {"bull_normal_min": 14.0, "high_vol_min": 28.0, "crisis_min": 48.0},
        "regimes": {
            "bull_normal": {"stop_loss_pct": -9.0, "max_hold_days": 4},
            "low_vol_complacency": {"profit_levels": [7.0, 14.0, 22.0]}
        },
        "backtest": {
            "baseline_hold_days": 3,
            "workers": 2,
            "grid": {"vix_bands": [[15, 30, 50]], "stop_scalars": [1.0], "profit_scalars": [0.9, 1.1]}
        },
        "alerts": {"max_drawdown_pct": -10.0, "position_concentration_pct": 30.0}
    })");
    config.load(path.string());

    assert(config.getLogLevel() == "debug");
    assert(config.getLogDir() == "/tmp/swingrisk_logs");
    assert(approx(config.getRegimeBands().crisis_min, 48.0));

    const auto& bull = config.getRegimeConfigs().at(RegimeType::BULL_NORMAL);
    assert(approx(bull.stop_loss_pct, -9.0));
    assert(bull.max_hold_days == 4);
    // 지정하지 않은 키는 기본값
    assert(approx(bull.tr_stop_multiplier, 1.8));
    assert(approx(config.getRegimeConfigs().at(RegimeType::LOW_VOL_COMPLACENCY).profit_levels_pct[2], 22.0));

    assert(config.getBacktestConfig().baseline_hold_days == 3);
    assert(config.getBacktestConfig().workers == 2);
    assert(config.getGridSearchSpace().size() == 2);
    assert(approx(config.getAlertConfig().max_drawdown_pct, -10.0));

    // Facade built from the loaded configuration
    engine::RiskEngine risk_engine(config);
    auto opened = risk_engine.openPosition("CFG", 100.0, MarketSnapshot(14.5), 10.0);
    assert(opened.regime == RegimeType::BULL_NORMAL);
    assert(approx(opened.stop_distance_pct, -9.0));
    assert(opened.expected_hold_days == 4);

    std::filesystem::remove(path);
}

void testMissingFileKeepsDefaults() {
    Config& config = Config::getInstance();
    config.resetToDefaults();
    config.load((std::filesystem::temp_directory_path() / "swingrisk_no_such_config.json").string());
    assert(config.getLogLevel() == "info");
    assert(approx(config.getRegimeConfigs().at(RegimeType::BULL_NORMAL).stop_loss_pct, -8.0));
}

void testInvalidContent() {
    Config& config = Config::getInstance();
    config.resetToDefaults();

    auto malformed = writeTemp("swingrisk_config_malformed.json", "{ \"logging\": ");
    assert(throwsConfigError([&] { config.load(malformed.string()); }));

    auto bad_levels = writeTemp("swingrisk_config_bad_levels.json",
        R"({"logging": {"level": "warn"}, "regimes": {"bull_normal": {"profit_levels": [12.0, 10.0, 40.0]}}})");
    assert(throwsConfigError([&] { config.load(bad_levels.string()); }));
    // Nothing applied from a rejected file
    assert(config.getLogLevel() == "info");
    assert(approx(config.getRegimeConfigs().at(RegimeType::BULL_NORMAL).profit_levels_pct[1], 25.0));

    auto bad_scaling = writeTemp("swingrisk_config_bad_scaling.json",
        R"({"regimes": {"high_vol_stress": {"position_scaling": [25.0, 50.0, 90.0]}}})");
    assert(throwsConfigError([&] { config.load(bad_scaling.string()); }));

    auto unknown = writeTemp("swingrisk_config_unknown.json", R"({"regimes": {"sideways": {}}})");
    assert(throwsConfigError([&] { config.load(unknown.string()); }));

    auto bad_bands = writeTemp("swingrisk_config_bad_bands.json",
        R"({"classifier": {"bull_normal_min": 40.0, "high_vol_min": 30.0}})");
    assert(throwsConfigError([&] { config.load(bad_bands.string()); }));

    auto wrong_type = writeTemp("swingrisk_config_wrong_type.json", R"({"backtest": {"workers": "many"}})");
    assert(throwsConfigError([&] { config.load(wrong_type.string()); }));

    for (const auto& p : {malformed, bad_levels, bad_scaling, unknown, bad_bands, wrong_type}) {
        std::filesystem::remove(p);
    }
    config.resetToDefaults();
}
}

int main() {
    std::cout << "[TEST] Starting Config Test..." << std::endl;

    testDefaults();
    testLoadOverrides();
    testMissingFileKeepsDefaults();
    testInvalidContent();

    std::cout << "[TEST] Config Test PASSED!" << std::endl;
    return 0;
}
