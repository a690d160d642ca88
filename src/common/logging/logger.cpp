// File: common/logging/logger.cpp

#include "common/logging/logger.hpp"

#include <filesystem>
#include <iostream>
#include <string_view>
#include <unordered_map>
#include <vector>

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace common::logging {

    namespace {
        constexpr const char *pattern = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%t] [%s:%# %!] %v";
    }

    std::shared_ptr<spdlog::logger> Logger::logger_ = nullptr;
    std::once_flag Logger::init_flag_;

    void Logger::init(const std::string &log_directory, const std::string &log_filename,
                      const std::string &log_level) {
        std::vector<spdlog::sink_ptr> sinks;
        sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());

        try {
            std::filesystem::create_directories(log_directory);
            sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(
                    (std::filesystem::path(log_directory) / log_filename).string(), true));
        } catch (const std::exception &ex) {
            std::cerr << "File sink unavailable, logging to console only: " << ex.what() << std::endl;
        }

        try {
            logger_ = std::make_shared<spdlog::logger>("imgdiff", sinks.begin(), sinks.end());
            logger_->set_level(getLogLevel(log_level));
            logger_->set_pattern(pattern);
            spdlog::set_default_logger(logger_);
        } catch (const spdlog::spdlog_ex &ex) {
            std::cerr << "Log initialization failed: " << ex.what() << std::endl;
            logger_.reset();
        }
    }

    void Logger::initialize(const std::string &log_directory, const std::string &log_filename,
                            const std::string &log_level) {
        bool applied = false;
        std::call_once(init_flag_, [&]() {
            init(log_directory, log_filename, log_level);
            applied = true;
        });
        if (!applied && logger_) {
            logger_->warn("Logger already initialized, ignoring sinks '{}/{}'.", log_directory, log_filename);
        }
    }

    void Logger::setLogLevel(const std::string &level) {
        std::call_once(init_flag_, []() { init(); });
        if (logger_) {
            logger_->set_level(getLogLevel(level));
        }
    }

    spdlog::level::level_enum Logger::getLogLevel(const std::string &level) {
        static const std::unordered_map<std::string_view, spdlog::level::level_enum> level_map = {
                {"trace", spdlog::level::trace}, {"debug", spdlog::level::debug},
                {"info", spdlog::level::info},   {"warn", spdlog::level::warn},
                {"error", spdlog::level::err},   {"critical", spdlog::level::critical},
                {"off", spdlog::level::off}};
        const auto iterator = level_map.find(level);
        return iterator != level_map.end() ? iterator->second : spdlog::level::debug;
    }

    std::shared_ptr<spdlog::logger> Logger::getLogger() {
        std::call_once(init_flag_, []() { init(); });
        return logger_;
    }

} // namespace common::logging
