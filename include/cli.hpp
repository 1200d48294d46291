/**
 * @file cli.hpp
 * @brief Command line interface parsing and options for timeparse.
 *
 * Declares CLI parsing helpers, option structures, and related exceptions for
 * the tool.
 */

#ifndef TIMEPARSE_CLI_HPP
#define TIMEPARSE_CLI_HPP

#include "config.hpp"
#include "granularity.hpp"
#include <exception>
#include <string>
#include <unordered_map>
#include <vector>

namespace tparse {

/**
 * Signals that CLI parsing requested an immediate exit (help, errors, etc.).
 * Used to bubble exit codes from parsing back to the main entry point without
 * treating them as fatal errors.
 */
class CliParseExit : public std::exception {
public:
  /**
   * Construct an exit signal with the desired exit code.
   *
   * @param exit_code Process exit code that should be returned to the caller.
   */
  explicit CliParseExit(int exit_code) noexcept : exit_code_(exit_code) {}

  /**
   * Retrieve the exit code that triggered the exception.
   *
   * @return Numeric process exit code.
   */
  int exit_code() const noexcept { return exit_code_; }

  const char *what() const noexcept override {
    return "CLI parsing requested exit";
  }

private:
  int exit_code_;
};

/**
 * Parsed command line options supplied via the CLI.
 *
 * Settings that may also come from a configuration file carry an
 * `_explicit` flag so the CLI value only wins when it was actually given.
 */
struct CliOptions {
  std::vector<std::string> expressions; ///< Duration expressions to parse
  bool read_stdin{false};               ///< Read expressions from stdin
  Granularity granularity{Granularity::Seconds}; ///< Two-field clock reading
  bool granularity_explicit{false}; ///< True if CLI set granularity
  OutputFormat output_format{OutputFormat::Text}; ///< Result format
  bool output_format_explicit{false}; ///< True if CLI set output format
  bool fail_fast{false};              ///< Stop at first unparseable input
  bool verbose = false;               ///< Enables verbose output
  std::string config_file;            ///< Optional path to configuration file
  std::string log_level = "info";     ///< Logging verbosity level
  bool log_level_explicit{false};     ///< True if CLI set log level
  std::string log_file;               ///< Optional path to log file
  int log_rotate{3}; ///< Number of rotated log files to keep (0 disables)
  bool log_rotate_explicit{false}; ///< True if CLI set log rotation count
  std::unordered_map<std::string, std::string>
      log_categories; ///< Category -> level overrides requested via CLI/config
  bool log_categories_explicit{false}; ///< True if CLI specified categories
};

/**
 * Parse command line arguments and return the normalized options structure.
 *
 * @param argc Number of elements supplied in @p argv.
 * @param argv Null-terminated array of raw CLI argument strings.
 * @return Populated options structure describing the requested behaviour.
 * @throws CliParseExit When parsing encounters conditions such as `--help`,
 *         `--version` or invalid arguments that require the application to
 *         exit early.
 */
CliOptions parse_cli(int argc, char **argv);

} // namespace tparse

#endif // TIMEPARSE_CLI_HPP
