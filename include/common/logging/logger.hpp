// File: common/logging/logger.hpp

#ifndef LOGGER_HPP
#define LOGGER_HPP

#include <filesystem>
#include <iostream>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <unordered_map>

#include <spdlog/fmt/ostr.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include "common/formatting/fmt_cv.hpp"

// The logger sits below config::Configuration (which logs while loading), so it must never read configuration.
namespace common::logging {

    /*
     * Process-wide "shotdiff" logger.
     *
     * Until initialize() is called, messages go to a console sink at info level; no file is touched. Once the
     * configuration has been read, initialize() swaps in the console sink plus <log_directory>/<log_filename>.
     */
    class Logger {
    public:
        Logger() = delete;

        template<typename... Args>
        static void log(spdlog::level::level_enum level, const char *file, int line, const char *func, const char *fmt,
                        Args &&...args);

        // An empty directory keeps the logger console-only. The log file is truncated on every call.
        static void initialize(const std::string &log_directory, const std::string &log_filename,
                               const std::string &log_level);

        // "trace" ... "critical", "off"; anything else maps to info.
        static spdlog::level::level_enum getLogLevel(std::string_view level);

        static std::shared_ptr<spdlog::logger> getLogger();

    private:
        static constexpr std::string_view name_ = "shotdiff";
        static constexpr std::string_view pattern_ = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%t] [%s:%#] %v";

        static std::shared_ptr<spdlog::logger> logger_;
        static std::once_flag init_flag_;

        static void createSinks(const std::string &log_directory, const std::string &log_filename,
                                spdlog::level::level_enum level);
    };

#define LOG_(level, fmt, ...)                                                                                          \
    common::logging::Logger::log(common::logging::Logger::getLogLevel(level), __FILE__, __LINE__, __FUNCTION__, fmt,   \
                                 ##__VA_ARGS__)
#define LOG_TRACE(fmt, ...) LOG_("trace", fmt, ##__VA_ARGS__)
#define LOG_DEBUG(fmt, ...) LOG_("debug", fmt, ##__VA_ARGS__)
#define LOG_INFO(fmt, ...) LOG_("info", fmt, ##__VA_ARGS__)
#define LOG_WARN(fmt, ...) LOG_("warn", fmt, ##__VA_ARGS__)
#define LOG_ERROR(fmt, ...) LOG_("error", fmt, ##__VA_ARGS__)
#define LOG_CRITICAL(fmt, ...) LOG_("critical", fmt, ##__VA_ARGS__)

    template<typename... Args>
    void Logger::log(const spdlog::level::level_enum level, const char *file, const int line, const char *func,
                     const char *fmt, Args &&...args) {
        const auto logger = getLogger();
        if (!logger) {
            std::cerr << "shotdiff logger unavailable: " << fmt << std::endl;
            return;
        }
        if (!logger->should_log(level)) {
            return;
        }

        const spdlog::source_loc source{file, line, func};
        if constexpr (sizeof...(args) > 0) {
            logger->log(source, level, fmt::vformat(fmt, fmt::make_format_args(args...)));
        } else {
            logger->log(source, level, fmt);
        }
    }

} // namespace common::logging

#endif // LOGGER_HPP
