#include "Logger.hpp"
#include <spdlog/pattern_formatter.h>
#include <mutex>

namespace Parley {

namespace {
std::mutex loggerMutex;
}

Logger& Logger::instance() {
    static Logger instance;
    return instance;
}

void Logger::initialize(const std::string& logFilePath, Level level) {
    std::lock_guard<std::mutex> lock(loggerMutex);
    try {
        auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
        auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            logFilePath, 1024 * 1024 * 5, 3); // 5MB, 3 files

        console_sink->set_pattern("[%H:%M:%S.%e] [%^%l%$] [%t] %v");
        file_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%f] [%l] [%t] %v");

        if (logger_) {
            spdlog::drop(logger_->name());
        }
        logger_ = std::make_shared<spdlog::logger>("parley",
            spdlog::sinks_init_list{console_sink, file_sink});
        logger_->set_level(static_cast<spdlog::level::level_enum>(level));
        spdlog::register_logger(logger_);

        logger_->info("Logger initialized with file: {}", logFilePath);

    } catch (const spdlog::spdlog_ex& ex) {
        // Fallback to console only
        if (logger_) {
            spdlog::drop(logger_->name());
        }
        logger_ = spdlog::stdout_color_mt("parley_fallback");
        logger_->set_level(static_cast<spdlog::level::level_enum>(level));
        logger_->error("Logger initialization failed: {}", ex.what());
    }
}

void Logger::setLevel(Level level) {
    std::lock_guard<std::mutex> lock(loggerMutex);
    if (logger_) {
        logger_->set_level(static_cast<spdlog::level::level_enum>(level));
    }
}

spdlog::logger* Logger::ensureLogger() {
    if (logger_) {
        return logger_.get();
    }
    std::lock_guard<std::mutex> lock(loggerMutex);
    if (!logger_) {
        logger_ = spdlog::get("parley_console");
        if (!logger_) {
            logger_ = spdlog::stdout_color_mt("parley_console");
        }
    }
    return logger_.get();
}

} // namespace Parley
