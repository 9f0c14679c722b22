#include "common/Logger.h"
#include "common/PathUtils.h"
#include <filesystem>
#include <stdexcept>
#include <vector>

namespace swingrisk {

Logger& Logger::getInstance() {
    static Logger instance;
    return instance;
}

void Logger::initialize(const std::string& log_dir, const std::string& level) {
    if (initialized_) return;

    // 상대 경로는 실행 파일 기준
    const std::filesystem::path logs_path = utils::PathUtils::resolveRelativePath(log_dir);

    try {
        std::filesystem::create_directories(logs_path);

        auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
        console_sink->set_pattern("[%Y-%m-%d %H:%M:%S] [%^%l%$] %v");

        auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            logs_path.string() + "/swingrisk.log", 1024 * 1024 * 10, 3
        );

        std::vector<spdlog::sink_ptr> sinks{console_sink, file_sink};
        main_logger_ = std::make_shared<spdlog::logger>("main", sinks.begin(), sinks.end());
        main_logger_->set_level(spdlog::level::from_str(level));
        main_logger_->flush_on(spdlog::level::warn);
        spdlog::register_logger(main_logger_);

        trade_logger_ = spdlog::daily_logger_mt("trade", logs_path.string() + "/trades.log");
        trade_logger_->set_pattern("%v");

        initialized_ = true;
        main_logger_->info("Logger initialized");
        main_logger_->info("Log directory: {}", logs_path.string());

    } catch (const spdlog::spdlog_ex& ex) {
        throw std::runtime_error(std::string("Log init failed: ") + ex.what());
    } catch (const std::filesystem::filesystem_error& ex) {
        throw std::runtime_error(std::string("Cannot create log directory: ") + ex.what());
    }
}

void Logger::logTrade(const std::string& symbol, const std::string& action,
                      double price, double position_pct, double pnl_pct) {
    if (!trade_logger_) {
        return;
    }
    // symbol,action,price,position%,pnl
    trade_logger_->info("{},{},{:.4f},{:.2f},{:.6f}", symbol, action, price, position_pct, pnl_pct);
}

} // namespace swingrisk
