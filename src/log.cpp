#include "log.hpp"
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include <spdlog/async.h>
#include <spdlog/async_logger.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/dist_sink.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace {
std::weak_ptr<spdlog::logger> g_logger;
std::mutex g_logger_mutex;
std::mutex g_thread_pool_mutex;
// File output is routed through a distributing sink shared by the default and
// category loggers, so a log file can be attached after they were created.
std::shared_ptr<spdlog::sinks::dist_sink_mt> g_file_sinks;
std::string g_log_file;

constexpr const char *kLoggerName = "timeparse";
constexpr std::size_t kMaxLogFileSize = 1024 * 1024 * 5;

// spdlog::shutdown() releases the pool, so it is recreated on demand.
void ensure_thread_pool() {
  std::lock_guard<std::mutex> lock(g_thread_pool_mutex);
  if (!spdlog::thread_pool()) {
    constexpr std::size_t queue_size = 8192;
    constexpr std::size_t num_threads = 1;
    spdlog::init_thread_pool(queue_size, num_threads);
  }
}

std::shared_ptr<spdlog::details::thread_pool> logging_pool() {
  ensure_thread_pool();
  return spdlog::thread_pool();
}
} // namespace

namespace tparse {

/**
 * Initialize the global spdlog logger with optional file rotation.
 *
 * @param level Logging verbosity level for the default logger.
 * @param pattern Log message pattern; empty string retains the default.
 * @param file Optional log file path.
 * @param rotate_files Maximum number of rotated files to keep.
 */
void init_logger(spdlog::level::level_enum level, const std::string &pattern,
                 const std::string &file, std::size_t rotate_files) {
  ensure_thread_pool();
  std::unique_lock<std::mutex> lock(g_logger_mutex);
  auto logger = spdlog::get(kLoggerName);
  if (!logger) {
    g_file_sinks = std::make_shared<spdlog::sinks::dist_sink_mt>();
    g_log_file.clear();
    std::vector<spdlog::sink_ptr> sinks;
    sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
    sinks.push_back(g_file_sinks);
    logger = std::make_shared<spdlog::async_logger>(
        kLoggerName, sinks.begin(), sinks.end(), logging_pool(),
        spdlog::async_overflow_policy::block);
    spdlog::set_default_logger(logger);
    g_logger = logger;
  }
  if (!file.empty() && file != g_log_file && g_file_sinks) {
    spdlog::sink_ptr file_sink;
    if (rotate_files > 0) {
      file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
          file, kMaxLogFileSize, rotate_files);
    } else {
      file_sink =
          std::make_shared<spdlog::sinks::basic_file_sink_mt>(file, true);
    }
    g_file_sinks->set_sinks({file_sink});
    g_log_file = file;
  }
  lock.unlock();
  // Category loggers follow the default level until overridden.
  spdlog::apply_all([level](const std::shared_ptr<spdlog::logger> &l) {
    l->set_level(level);
  });
  if (!pattern.empty()) {
    spdlog::set_pattern(pattern);
  }
  logger->debug("Logger initialised (level={}, file='{}', rotate={})",
                spdlog::level::to_string_view(level), file, rotate_files);
}

/**
 * Ensure that the default logger exists before logging.
 *
 * Creates a new logger when previous initialization was skipped or lost.
 */
void ensure_default_logger() {
  auto logger = spdlog::default_logger();
  auto locked = g_logger.lock();
  if (!logger || !locked || logger.get() != locked.get()) {
    init_logger(spdlog::level::info);
  }
}

std::shared_ptr<spdlog::logger> category_logger(const std::string &category) {
  ensure_thread_pool();
  std::unique_lock<std::mutex> lock(g_logger_mutex);
  const std::string name = std::string(kLoggerName) + "." + category;
  auto logger = spdlog::get(name);
  if (logger) {
    return logger;
  }
  auto default_logger = spdlog::default_logger();
  if (!default_logger) {
    lock.unlock();
    init_logger(spdlog::level::info);
    lock.lock();
    default_logger = spdlog::default_logger();
  }
  std::vector<spdlog::sink_ptr> sinks;
  if (default_logger) {
    sinks = default_logger->sinks();
  } else {
    sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
  }
  auto new_logger = std::make_shared<spdlog::async_logger>(
      name, sinks.begin(), sinks.end(), logging_pool(),
      spdlog::async_overflow_policy::block);
  auto level = default_logger ? default_logger->level() : spdlog::level::info;
  new_logger->set_level(level);
  spdlog::register_logger(new_logger);
  return new_logger;
}

void configure_log_categories(
    const std::unordered_map<std::string, spdlog::level::level_enum>
        &overrides) {
  if (overrides.empty()) {
    return;
  }
  for (const auto &[category, level] : overrides) {
    auto logger = category_logger(category);
    logger->set_level(level);
    logger->debug("Category '{}' set to level {}", category,
                  spdlog::level::to_string_view(level));
  }
  category_logger("logging")->debug("Applied {} log category override(s)",
                                    overrides.size());
}

} // namespace tparse
