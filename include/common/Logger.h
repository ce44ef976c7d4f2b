#pragma once

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/daily_file_sink.h>
#include <memory>
#include <string>

namespace instflow {

class Logger {
public:
    static Logger& getInstance();

    // Until initialize() runs every call is a no-op (library code stays quiet in tests)
    void initialize(const std::string& log_dir = "logs", const std::string& level = "info");

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

    // One CSV line per enriched security in signals.log
    void logSignal(const std::string& symbol, const std::string& flow_signal,
                   const std::string& overall_signal, int score, double last_price);

private:
    Logger() = default;
    std::shared_ptr<spdlog::logger> main_logger_;
    std::shared_ptr<spdlog::logger> signal_logger_;
    bool initialized_ = false;
};

#define LOG_DEBUG(...) instflow::Logger::getInstance().debug(__VA_ARGS__)
#define LOG_INFO(...) instflow::Logger::getInstance().info(__VA_ARGS__)
#define LOG_WARN(...) instflow::Logger::getInstance().warn(__VA_ARGS__)
#define LOG_ERROR(...) instflow::Logger::getInstance().error(__VA_ARGS__)

} // namespace instflow
