#pragma once

/**
 * @file logger.hpp
 * @brief Logging utilities for bulkstream
 */

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <memory>
#include <string>
#include <string_view>

namespace bulkstream {

/**
 * @brief Logger wrapper for bulkstream
 */
class Logger {
public:
    /**
     * @brief Initialize the logging system
     * @param name Logger name
     * @param level Log level (trace, debug, info, warn, error, critical)
     */
    static void init(const std::string& name = "bulkstream",
                     spdlog::level::level_enum level = spdlog::level::info);

    /**
     * @brief Get the logger instance
     */
    static std::shared_ptr<spdlog::logger>& get();

    /**
     * @brief Set the log level
     */
    static void set_level(spdlog::level::level_enum level);

    /**
     * @brief Set the log level from its name ("debug", "warn", "off", ...)
     * @return false if the name is not a known level
     */
    static bool set_level(std::string_view name);

    /**
     * @brief Shutdown the logging system
     */
    static void shutdown();

private:
    static std::shared_ptr<spdlog::logger> logger_;
};

// Convenience macros for logging
#define LOG_TRACE(...)    SPDLOG_LOGGER_TRACE(bulkstream::Logger::get(), __VA_ARGS__)
#define LOG_DEBUG(...)    SPDLOG_LOGGER_DEBUG(bulkstream::Logger::get(), __VA_ARGS__)
#define LOG_INFO(...)     SPDLOG_LOGGER_INFO(bulkstream::Logger::get(), __VA_ARGS__)
#define LOG_WARN(...)     SPDLOG_LOGGER_WARN(bulkstream::Logger::get(), __VA_ARGS__)
#define LOG_ERROR(...)    SPDLOG_LOGGER_ERROR(bulkstream::Logger::get(), __VA_ARGS__)
#define LOG_CRITICAL(...) SPDLOG_LOGGER_CRITICAL(bulkstream::Logger::get(), __VA_ARGS__)

}  // namespace bulkstream
