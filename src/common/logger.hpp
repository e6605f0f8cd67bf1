#pragma once

/**
 * @file logger.hpp
 * @brief Logging utilities for mdfkit
 */

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <memory>
#include <string>

namespace mdfkit {

/**
 * @brief Process-wide logger used by the decoder
 *
 * Logs go to stderr so that tools printing decoded rows on stdout keep a
 * clean data stream. The default level is warn: per-slot and per-page
 * failures are reported through Status values, the log only carries
 * diagnostics (truncated LOBs, skipped catalog objects, cache statistics).
 */
class Logger {
public:
    /**
     * @brief Initialize the logging system
     * @param name Logger name
     * @param level Log level (trace, debug, info, warn, error, critical)
     */
    static void init(const std::string& name = "mdfkit",
                     spdlog::level::level_enum level = spdlog::level::warn);

    /**
     * @brief Get the logger instance, initializing it on first use
     */
    static std::shared_ptr<spdlog::logger>& get();

    static void set_level(spdlog::level::level_enum level);

    /**
     * @brief Parse a level name ("trace", "debug", "info", "warn", ...)
     * @return false if the name is unknown
     */
    static bool parse_level(const std::string& name,
                            spdlog::level::level_enum* level);

    static void shutdown();

private:
    static std::shared_ptr<spdlog::logger> logger_;
};

// Convenience macros for logging
#define LOG_TRACE(...)    SPDLOG_LOGGER_TRACE(mdfkit::Logger::get(), __VA_ARGS__)
#define LOG_DEBUG(...)    SPDLOG_LOGGER_DEBUG(mdfkit::Logger::get(), __VA_ARGS__)
#define LOG_INFO(...)     SPDLOG_LOGGER_INFO(mdfkit::Logger::get(), __VA_ARGS__)
#define LOG_WARN(...)     SPDLOG_LOGGER_WARN(mdfkit::Logger::get(), __VA_ARGS__)
#define LOG_ERROR(...)    SPDLOG_LOGGER_ERROR(mdfkit::Logger::get(), __VA_ARGS__)
#define LOG_CRITICAL(...) SPDLOG_LOGGER_CRITICAL(mdfkit::Logger::get(), __VA_ARGS__)

}  // namespace mdfkit
