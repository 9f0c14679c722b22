#pragma once

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/daily_file_sink.h>
#include <memory>
#include <string>

namespace swingrisk {

class Logger {
public:
    static Logger& getInstance();
    void initialize(const std::string& log_dir = "logs", const std::string& level = "info");
    bool isInitialized() const { return initialized_; }

    // 초기화 전에는 아무것도 출력하지 않는다
    template<typename... Args>
    void debug(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        if (main_logger_) {
            main_logger_->debug(fmt, std::forward<Args>(args)...);
        }
    }

    template<typename... Args>
    void info(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        if (main_logger_) {
            main_logger_->info(fmt, std::forward<Args>(args)...);
        }
    }

    template<typename... Args>
    void warn(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        if (main_logger_) {
            main_logger_->warn(fmt, std::forward<Args>(args)...);
        }
    }

    template<typename... Args>
    void error(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        if (main_logger_) {
            main_logger_->error(fmt, std::forward<Args>(args)...);
        }
    }

    // 체결된 액션 1건 = trades.log 한 줄
    void logTrade(const std::string& symbol, const std::string& action,
                  double price, double position_pct, double pnl_pct);

private:
    Logger() = default;
    std::shared_ptr<spdlog::logger> main_logger_;
    std::shared_ptr<spdlog::logger> trade_logger_;
    bool initialized_ = false;
};

#define LOG_DEBUG(...) swingrisk::Logger::getInstance().debug(__VA_ARGS__)
#define LOG_INFO(...) swingrisk::Logger::getInstance().info(__VA_ARGS__)
#define LOG_WARN(...) swingrisk::Logger::getInstance().warn(__VA_ARGS__)
#define LOG_ERROR(...) swingrisk::Logger::getInstance().error(__VA_ARGS__)

} // namespace swingrisk
