/**
 * @file log.hpp
 * @brief Logging utilities for timeparse.
 *
 * Declares logger initialization, category loggers, and log category
 * configuration.
 */

#ifndef TIMEPARSE_LOG_HPP
#define TIMEPARSE_LOG_HPP

#include <cstddef>
#include <memory>
#include <spdlog/spdlog.h>
#include <string>
#include <unordered_map>

namespace tparse {

/**
 * Initialize the global logger with a stderr sink and an optional file sink.
 *
 * Standard output is reserved for parse results, so console logging goes to
 * standard error.
 *
 * @param level Logging verbosity level to use for all loggers.
 * @param pattern Log message pattern. Provide an empty string to keep the
 *        underlying spdlog default.
 * @param file Optional log file path. When empty no file output is
 *        configured. A file given after the logger already exists is
 *        attached to it and to every category logger.
 * @param rotate_files Maximum number of rotated files to retain when
 *        @p file is provided; 0 writes a single file without rotation.
 */
void init_logger(spdlog::level::level_enum level,
                 const std::string &pattern = "", const std::string &file = "",
                 std::size_t rotate_files = 3);

/**
 * Retrieve or create a logger dedicated to a specific category.
 *
 * Category loggers share sinks with the default logger so messages appear in
 * the same destinations. They allow fine-grained log-level overrides. Look
 * the logger up on each use rather than caching it: spdlog::shutdown() drops
 * it.
 *
 * @param category Arbitrary category name used as the logger identifier.
 * @return Shared pointer to the category logger.
 */
std::shared_ptr<spdlog::logger> category_logger(const std::string &category);

/**
 * Apply log level overrides for specific categories.
 *
 * @param overrides Mapping of category name to desired log level.
 */
void configure_log_categories(
    const std::unordered_map<std::string, spdlog::level::level_enum>
        &overrides);

/**
 * Ensure a default logger exists before logging.
 *
 * Calling spdlog logging macros requires a default logger. This helper creates
 * one on demand when the logging subsystem has not been explicitly
 * initialized.
 */
void ensure_default_logger();

} // namespace tparse

#endif // TIMEPARSE_LOG_HPP
