#pragma once

#include <spdlog/spdlog.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <fmt/core.h>
#include <memory>
#include <string>

namespace Parley {

class Logger {
public:
    enum class Level {
        Trace = 0,
        Debug = 1,
        Info = 2,
        Warn = 3,
        Error = 4,
        Critical = 5
    };

    static Logger& instance();

    void initialize(const std::string& logFilePath = "parley.log",
                    Level level = Level::Info);

    void setLevel(Level level);
    bool isInitialized() const { return logger_ != nullptr; }

    template<typename... Args>
    void trace(fmt::format_string<Args...> format, Args&&... args) {
        ensureLogger()->trace(format, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void debug(fmt::format_string<Args...> format, Args&&... args) {
        ensureLogger()->debug(format, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void info(fmt::format_string<Args...> format, Args&&... args) {
        ensureLogger()->info(format, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void warn(fmt::format_string<Args...> format, Args&&... args) {
        ensureLogger()->warn(format, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void error(fmt::format_string<Args...> format, Args&&... args) {
        ensureLogger()->error(format, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void critical(fmt::format_string<Args...> format, Args&&... args) {
        ensureLogger()->critical(format, std::forward<Args>(args)...);
    }

private:
    Logger() = default;

    // Components may log before main() has configured the sinks
    // (tests, static helpers); they get a console logger until then.
    spdlog::logger* ensureLogger();

    std::shared_ptr<spdlog::logger> logger_;
};

#define PARLEY_TRACE(...) Parley::Logger::instance().trace(__VA_ARGS__)
#define PARLEY_DEBUG(...) Parley::Logger::instance().debug(__VA_ARGS__)
#define PARLEY_INFO(...) Parley::Logger::instance().info(__VA_ARGS__)
#define PARLEY_WARN(...) Parley::Logger::instance().warn(__VA_ARGS__)
#define PARLEY_ERROR(...) Parley::Logger::instance().error(__VA_ARGS__)
#define PARLEY_CRITICAL(...) Parley::Logger::instance().critical(__VA_ARGS__)

} // namespace Parley
