#ifndef TIMEPARSE_CONFIG_HPP
#define TIMEPARSE_CONFIG_HPP

#include "granularity.hpp"
#include <nlohmann/json_fwd.hpp>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>

namespace tparse {

/** \brief How the command line tool prints parse results. */
enum class OutputFormat {
  Text, ///< One value per line.
  Json  ///< A JSON array of result objects.
};

/**
 * @brief Converts an OutputFormat to its string representation.
 * @return "text" or "json".
 */
std::string to_string(OutputFormat format);

/**
 * @brief Parses a string to an OutputFormat value.
 * @param value String to parse (case-insensitive).
 * @return Optional OutputFormat if recognized, std::nullopt otherwise.
 */
std::optional<OutputFormat> output_format_from_string(std::string value);

/// Tool configuration loaded from a YAML, TOML, or JSON file.
class Config {
public:
  /** Check whether verbose output is enabled. */
  bool verbose() const { return verbose_; }

  /// Set verbose output mode.
  void set_verbose(bool verbose) { verbose_ = verbose; }

  /// Reading applied to two-field clock expressions.
  Granularity granularity() const { return granularity_; }

  /// Set the reading applied to two-field clock expressions.
  void set_granularity(Granularity granularity) { granularity_ = granularity; }

  /// Result printing format.
  OutputFormat output_format() const { return output_format_; }

  /// Set result printing format.
  void set_output_format(OutputFormat format) { output_format_ = format; }

  /// Stop at the first expression that cannot be parsed.
  bool fail_fast() const { return fail_fast_; }

  /// Enable or disable stopping at the first unparseable expression.
  void set_fail_fast(bool enable) { fail_fast_ = enable; }

  /// Get logging verbosity level.
  const std::string &log_level() const { return log_level_; }

  /// Set logging verbosity level.
  void set_log_level(const std::string &level) { log_level_ = level; }

  /// Get logging pattern.
  const std::string &log_pattern() const { return log_pattern_; }

  /// Set logging pattern.
  void set_log_pattern(const std::string &pattern) { log_pattern_ = pattern; }

  /// Path to log file.
  const std::string &log_file() const { return log_file_; }

  /// Set path for log file.
  void set_log_file(const std::string &file) { log_file_ = file; }

  /// Number of rotated log files to retain (0 disables rotation).
  int log_rotate() const { return log_rotate_; }

  /// Set number of rotated log files to retain.
  void set_log_rotate(int count) { log_rotate_ = count < 0 ? 0 : count; }

  /// Category -> level overrides for category loggers.
  const std::unordered_map<std::string, std::string> &log_categories() const {
    return log_categories_;
  }

  /// Replace the category log level overrides.
  void set_log_categories(
      std::unordered_map<std::string, std::string> categories) {
    log_categories_ = std::move(categories);
  }

  /// Load configuration from the file at `path`.
  static Config from_file(const std::string &path);

  /// Build configuration from a JSON object.
  static Config from_json(const nlohmann::json &j);

  /// Populate this configuration from a JSON object.
  void load_json(const nlohmann::json &j);

private:
  bool verbose_ = false;
  Granularity granularity_ = Granularity::Seconds;
  OutputFormat output_format_ = OutputFormat::Text;
  bool fail_fast_ = false;
  std::string log_level_ = "info";
  std::string log_pattern_;
  std::string log_file_;
  int log_rotate_ = 3;
  std::unordered_map<std::string, std::string> log_categories_;
};

} // namespace tparse

#endif // TIMEPARSE_CONFIG_HPP
