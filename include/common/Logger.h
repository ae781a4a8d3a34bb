#pragma once

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/daily_file_sink.h>
#include <nlohmann/json.hpp>
#include <memory>
#include <string>

namespace marketpipe {

class Logger {
public:
    static Logger& getInstance();
    void initialize(const std::string& log_dir = "logs", const std::string& level = "info");

    template<typename... Args>
    void debug(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        logger()->debug(fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void info(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        logger()->info(fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void warn(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        logger()->warn(fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void error(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        logger()->error(fmt, std::forward<Args>(args)...);
    }

    // 구조화 이벤트 (JSON 한 줄)
    void logEvent(const std::string& event, nlohmann::json fields = nlohmann::json::object());

private:
    Logger() = default;

    // initialize() 전에는 spdlog 기본 로거 사용
    spdlog::logger* logger() const {
        return main_logger_ ? main_logger_.get() : spdlog::default_logger_raw();
    }

    std::shared_ptr<spdlog::logger> main_logger_;
    std::shared_ptr<spdlog::logger> event_logger_;
    bool initialized_ = false;
};

#define LOG_DEBUG(...) marketpipe::Logger::getInstance().debug(__VA_ARGS__)
#define LOG_INFO(...) marketpipe::Logger::getInstance().info(__VA_ARGS__)
#define LOG_WARN(...) marketpipe::Logger::getInstance().warn(__VA_ARGS__)
#define LOG_ERROR(...) marketpipe::Logger::getInstance().error(__VA_ARGS__)
#define LOG_EVENT(name, fields) marketpipe::Logger::getInstance().logEvent(name, fields)

} // namespace marketpipe
