// File: common/logging/logger.cpp

#include "common/logging/logger.hpp"

#include <vector>

namespace common::logging {

    std::shared_ptr<spdlog::logger> Logger::logger_ = nullptr;
    std::once_flag Logger::init_flag_;

    void Logger::initialize(const std::string &log_directory, const std::string &log_filename,
                            const std::string &log_level) {
        std::call_once(init_flag_, [] {});
        createSinks(log_directory, log_filename, getLogLevel(log_level));
    }

    std::shared_ptr<spdlog::logger> Logger::getLogger() {
        std::call_once(init_flag_, [] { createSinks({}, {}, spdlog::level::info); });
        return logger_;
    }

    void Logger::createSinks(const std::string &log_directory, const std::string &log_filename,
                             const spdlog::level::level_enum level) {
        try {
            std::vector<spdlog::sink_ptr> sinks{std::make_shared<spdlog::sinks::stdout_color_sink_mt>()};

            if (!log_directory.empty()) {
                std::filesystem::create_directories(log_directory);
                const auto path = std::filesystem::path(log_directory) / log_filename;
                sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(path.string(), true));
            }

            auto logger = std::make_shared<spdlog::logger>(std::string(name_), sinks.begin(), sinks.end());
            logger->set_level(level);
            logger->set_pattern(std::string(pattern_));
            logger->flush_on(spdlog::level::warn);

            spdlog::drop(std::string(name_));
            spdlog::register_logger(logger);
            spdlog::set_default_logger(logger);
            logger_ = std::move(logger);
        } catch (const spdlog::spdlog_ex &ex) {
            std::cerr << "Log initialization failed: " << ex.what() << std::endl;
        } catch (const std::filesystem::filesystem_error &ex) {
            std::cerr << "Log directory could not be created: " << ex.what() << std::endl;
        }
    }

    spdlog::level::level_enum Logger::getLogLevel(const std::string_view level) {
        static const std::unordered_map<std::string_view, spdlog::level::level_enum> levels{
                {"trace", spdlog::level::trace}, {"debug", spdlog::level::debug},
                {"info", spdlog::level::info},   {"warn", spdlog::level::warn},
                {"error", spdlog::level::err},   {"critical", spdlog::level::critical},
                {"off", spdlog::level::off}};

        const auto it = levels.find(level);
        return it != levels.end() ? it->second : spdlog::level::info;
    }

} // namespace common::logging
