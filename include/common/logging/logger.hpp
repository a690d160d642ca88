// File: common/logging/logger.hpp

#ifndef LOGGER_HPP
#define LOGGER_HPP

#include <memory>
#include <mutex>
#include <string>

#include <spdlog/spdlog.h>

#include "common/formatting/fmt_cv.hpp"

// NOTE: Logger MUST NOT depend on config::Configuration, configuration loading logs through it
namespace common::logging {

    /*
     * Process-wide spdlog logger writing to the console and to <directory>/<file>.
     * Sinks are fixed by whichever comes first: initialize() or the first log call (defaults ./logs/imgdiff.log).
     * After that only the level can change, and spdlog stores it atomically.
     */
    class Logger {
    public:
        Logger() = delete;

        template<typename... Args>
        static void log(spdlog::level::level_enum level, const char *file, int line, const char *func, const char *fmt,
                        Args &&...args);

        // Only effective before the first log call, later calls keep the existing sinks.
        static void initialize(const std::string &log_directory, const std::string &log_filename,
                               const std::string &log_level);

        static void setLogLevel(const std::string &level);

        // "trace" .. "critical", "off". Anything else maps to debug.
        static spdlog::level::level_enum getLogLevel(const std::string &level);

        static std::shared_ptr<spdlog::logger> getLogger();

    private:
        static std::shared_ptr<spdlog::logger> logger_;
        static std::once_flag init_flag_;

        static void init(const std::string &log_directory = "./logs", const std::string &log_filename = "imgdiff.log",
                         const std::string &log_level = "debug");
    };

#define LOG_(level, fmt, ...)                                                                                          \
    common::logging::Logger::log(level, __FILE__, __LINE__, __FUNCTION__, fmt, ##__VA_ARGS__)
#define LOG_TRACE(fmt, ...) LOG_(spdlog::level::trace, fmt, ##__VA_ARGS__)
#define LOG_DEBUG(fmt, ...) LOG_(spdlog::level::debug, fmt, ##__VA_ARGS__)
#define LOG_INFO(fmt, ...) LOG_(spdlog::level::info, fmt, ##__VA_ARGS__)
#define LOG_WARN(fmt, ...) LOG_(spdlog::level::warn, fmt, ##__VA_ARGS__)
#define LOG_ERROR(fmt, ...) LOG_(spdlog::level::err, fmt, ##__VA_ARGS__)
#define LOG_CRITICAL(fmt, ...) LOG_(spdlog::level::critical, fmt, ##__VA_ARGS__)

    template<typename... Args>
    void Logger::log(spdlog::level::level_enum level, const char *file, int line, const char *func, const char *fmt,
                     Args &&...args) {
        std::call_once(init_flag_, []() { init(); });
        if (!logger_ || !logger_->should_log(level)) {
            return;
        }
        const spdlog::source_loc source{file, line, func};
        if constexpr (sizeof...(args) > 0) {
            logger_->log(source, level, fmt::vformat(fmt, fmt::make_format_args(args...)));
        } else {
            logger_->log(source, level, fmt);
        }
    }

} // namespace common::logging

#endif // LOGGER_HPP
