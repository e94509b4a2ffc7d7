#pragma once

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/daily_file_sink.h>
#include <memory>
#include <string>

namespace capflow {

class Logger {
public:
    static Logger& getInstance();
    void initialize(const std::string& log_dir = "logs", const std::string& level = "info");
    bool isInitialized() const { return initialized_; }

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

    // One CSV row per completed reallocation.
    void logReallocation(const std::string& asset, const std::string& from_venue,
                         const std::string& to_venue, long long amount,
                         int yield_improvement_bps, double net_benefit);

private:
    Logger() = default;
    std::shared_ptr<spdlog::logger> main_logger_;
    std::shared_ptr<spdlog::logger> reallocation_logger_;
    bool initialized_ = false;
};

#define LOG_INFO(...) capflow::Logger::getInstance().info(__VA_ARGS__)
#define LOG_WARN(...) capflow::Logger::getInstance().warn(__VA_ARGS__)
#define LOG_ERROR(...) capflow::Logger::getInstance().error(__VA_ARGS__)

} // namespace capflow
