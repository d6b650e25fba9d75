/*
 * logging_session.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-11-28

Description: Installs the configured spdlog outputs for the lifetime of a
program run

**************************************************/

#ifndef FLYSCAN_LOGGING_LOGGING_SESSION_HPP
#define FLYSCAN_LOGGING_LOGGING_SESSION_HPP

#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include <spdlog/spdlog.h>

#include "config/sections/logging_config.hpp"

namespace flyscan::logging {

/**
 * @brief Map a configuration level name to the spdlog level
 * @return nullopt for a name spdlog does not know
 */
[[nodiscard]] auto parseLevel(std::string_view name)
    -> std::optional<spdlog::level::level_enum>;

/**
 * @brief Default logger built from a LoggingConfig
 *
 * Library code logs through spdlog's free functions, so installing the
 * default logger routes every module to the configured outputs. The logger
 * that was the default before is restored on destruction.
 */
class LoggingSession {
public:
    /**
     * @throws spdlog::spdlog_ex if the log file cannot be opened
     * @throws std::filesystem::filesystem_error if its directory cannot be
     *         created
     */
    explicit LoggingSession(const config::LoggingConfig& config,
                            std::string loggerName = "flyscan");
    ~LoggingSession();

    LoggingSession(const LoggingSession&) = delete;
    LoggingSession& operator=(const LoggingSession&) = delete;

    [[nodiscard]] auto logger() const -> const std::shared_ptr<spdlog::logger>& {
        return logger_;
    }

private:
    std::shared_ptr<spdlog::logger> logger_;
    std::shared_ptr<spdlog::logger> previous_;
};

}  // namespace flyscan::logging

#endif  // FLYSCAN_LOGGING_LOGGING_SESSION_HPP
