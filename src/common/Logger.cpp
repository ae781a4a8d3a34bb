#include "common/Logger.h"
#include "common/PathUtils.h"
#include <boost/date_time/posix_time/posix_time.hpp>
#include <filesystem>

namespace marketpipe {

Logger& Logger::getInstance() {
    static Logger instance;
    return instance;
}

void Logger::initialize(const std::string& log_dir, const std::string& level) {
    if (initialized_) return;

    // 실행 파일 기준 로그 경로
    std::filesystem::path logs_path;
    if (std::filesystem::path(log_dir).is_absolute()) {
        logs_path = log_dir;
    } else {
        logs_path = utils::PathUtils::resolveRelativePath(log_dir);
    }

    try {
        std::filesystem::create_directories(logs_path);

        auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
        console_sink->set_pattern("[%Y-%m-%d %H:%M:%S] [%^%l%$] %v");

        auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            (logs_path / "marketpipe.log").string(), 1024 * 1024 * 10, 3
        );

        std::vector<spdlog::sink_ptr> sinks{console_sink, file_sink};
        main_logger_ = std::make_shared<spdlog::logger>("main", sinks.begin(), sinks.end());
        main_logger_->set_level(spdlog::level::from_str(level));
        main_logger_->flush_on(spdlog::level::warn);
        spdlog::register_logger(main_logger_);

        // 파이프라인 이벤트는 JSON 라인으로 별도 파일
        event_logger_ = spdlog::daily_logger_mt("events", (logs_path / "pipeline_events.log").string());
        event_logger_->set_pattern("%v");

        initialized_ = true;
        main_logger_->info("Logger initialized");
        main_logger_->info("Log directory: {}", logs_path.string());

    } catch (const std::exception& ex) {
        throw std::runtime_error(std::string("Log init failed: ") + ex.what());
    }
}

void Logger::logEvent(const std::string& event, nlohmann::json fields) {
    if (!fields.is_object()) {
        nlohmann::json wrapped = nlohmann::json::object();
        wrapped["data"] = std::move(fields);
        fields = std::move(wrapped);
    }
    fields["event"] = event;
    fields["ts"] = boost::posix_time::to_iso_extended_string(
        boost::posix_time::microsec_clock::universal_time()) + "Z";

    const std::string line = fields.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
    if (event_logger_) {
        event_logger_->info(line);
    }
    logger()->debug("{}", line);
}

} // namespace marketpipe
