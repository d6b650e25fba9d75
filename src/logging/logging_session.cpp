/*
 * logging_session.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "logging_session.hpp"

#include <filesystem>
#include <utility>
#include <vector>

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace flyscan::logging {

auto parseLevel(std::string_view name)
    -> std::optional<spdlog::level::level_enum> {
    const std::string text(name);
    const auto level = spdlog::level::from_str(text);
    // from_str maps every unknown name to off
    if (level == spdlog::level::off && text != "off") {
        return std::nullopt;
    }
    return level;
}

LoggingSession::LoggingSession(const config::LoggingConfig& config,
                               std::string loggerName) {
    std::vector<spdlog::sink_ptr> sinks;
    if (config.console) {
        sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
    }
    if (!config.file.empty()) {
        const std::filesystem::path path(config.file);
        if (path.has_parent_path()) {
            std::filesystem::create_directories(path.parent_path());
        }
        sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            config.file, static_cast<size_t>(config.maxFileSizeKb) * 1024,
            static_cast<size_t>(config.maxFiles)));
    }

    logger_ = std::make_shared<spdlog::logger>(std::move(loggerName),
                                               sinks.begin(), sinks.end());
    logger_->set_level(parseLevel(config.level).value_or(spdlog::level::info));
    logger_->set_pattern(config.pattern);
    logger_->flush_on(spdlog::level::warn);

    previous_ = spdlog::default_logger();
    spdlog::set_default_logger(logger_);
    spdlog::debug("Logging to {} output(s) at level {}", sinks.size(),
                  config.level);
}

LoggingSession::~LoggingSession() {
    logger_->flush();
    spdlog::set_default_logger(previous_);
}

}  // namespace flyscan::logging
