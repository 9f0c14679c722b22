#include "common/Logger.h"
#include "common/Config.h"
#include "common/Errors.h"
#include "common/PathUtils.h"
#include "backtest/DataHistory.h"
#include "core/report/ReportSchema.h"
#include "engine/RiskEngine.h"

#include <nlohmann/json.hpp>

#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>
#include <vector>

using namespace swingrisk;

static void printUsage() {
    std::cerr << "usage: swingrisk_backtest <trades.json> [--config <config.json>] "
                 "[--no-optimize] [--output <report.json>]\n";
}

int main(int argc, char* argv[]) {
    if (argc < 2) {
        printUsage();
        return 1;
    }

    std::string trades_path;
    std::string config_path = "config/config.json";
    std::string output_path;
    bool run_optimizer = true;

    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            config_path = argv[++i];
            continue;
        }
        if (arg == "--output" && i + 1 < argc) {
            output_path = argv[++i];
            continue;
        }
        if (arg == "--no-optimize") {
            run_optimizer = false;
            continue;
        }
        if (arg == "--help" || arg == "-h") {
            printUsage();
            return 0;
        }
        if (!trades_path.empty()) {
            std::cerr << "알 수 없는 인자: " << arg << "\n";
            printUsage();
            return 1;
        }
        trades_path = arg;
    }

    if (trades_path.empty()) {
        printUsage();
        return 1;
    }

    try {
        Config::getInstance().load(config_path);
        auto& config = Config::getInstance();

        Logger::getInstance().initialize(config.getLogDir(), config.getLogLevel());

        trades_path = utils::PathUtils::findExistingPath(trades_path).string();
        if (!std::filesystem::exists(trades_path)) {
            std::cerr << "거래 파일을 찾을 수 없습니다: " << trades_path << "\n";
            return 1;
        }
        LOG_INFO("Starting multi-layer backtest with file: {}", trades_path);

        const auto trades = backtest::DataHistory::loadJSON(trades_path);
        engine::RiskEngine risk_engine(config);

        nlohmann::json report;
        report["backtest"] = core::report::toJson(risk_engine.runBacktest(trades));
        if (run_optimizer) {
            report["optimization"] = core::report::toJson(risk_engine.optimizeParameters(trades));
        }

        const std::string text = report.dump(2);
        if (!output_path.empty()) {
            std::ofstream out(output_path, std::ios::binary | std::ios::trunc);
            if (!out.is_open()) {
                throw RiskError("cannot write report: " + output_path);
            }
            out << text << "\n";
            LOG_INFO("Report written to {}", output_path);
        } else {
            std::cout << text << std::endl;
        }
        return 0;
    } catch (const RiskError& e) {
        LOG_ERROR("Backtest failed: {}", e.what());
        std::cerr << "오류: " << e.what() << std::endl;
        return 1;
    } catch (const std::exception& e) {
        LOG_ERROR("Fatal error: {}", e.what());
        std::cerr << "오류가 발생했습니다: " << e.what() << std::endl;
        return 1;
    }
}
