/**
 * @file app.hpp
 * @brief Main application entry point and orchestrator for timeparse.
 *
 * Declares the App class, which merges CLI options with configuration,
 * initializes logging and parses each requested duration expression.
 */

#ifndef TIMEPARSE_APP_HPP
#define TIMEPARSE_APP_HPP

#include "cli.hpp"
#include "config.hpp"
#include "parsed_duration.hpp"
#include <iosfwd>
#include <optional>
#include <string>
#include <vector>

namespace tparse {

/** \brief Outcome of parsing one expression. */
struct ExpressionResult {
  std::string input;                   ///< Expression as supplied.
  std::optional<ParsedDuration> value; ///< Seconds, empty when unparseable.
};

/**
 * Main application entry point responsible for orchestrating high level
 * application flow, configuration loading, and CLI parsing.
 */
class App {
public:
  /// Application reading standard input and writing standard output.
  App();

  /**
   * Application bound to explicit streams.
   *
   * @param in Source of expressions when reading from stdin is requested.
   * @param out Destination of the parse results.
   */
  App(std::istream &in, std::ostream &out);

  /**
   * Run the application with the given command line arguments.
   *
   * @param argc Number of CLI arguments supplied to the executable.
   * @param argv Null-terminated array containing the raw CLI arguments.
   * @return Zero when every expression parsed, one when any failed or a
   *         runtime error occurred, or the CLI exit code for usage errors.
   */
  int run(int argc, char **argv);

  /**
   * Retrieve the parsed command line options merged with configuration.
   */
  const CliOptions &options() const { return options_; }

  /**
   * Retrieve the loaded configuration.
   */
  const Config &config() const { return config_; }

  /// Results of the last run, in input order.
  const std::vector<ExpressionResult> &results() const { return results_; }

  /**
   * Determine whether run() stopped before parsing, e.g. for `--help`.
   */
  bool should_exit() const { return should_exit_; }

private:
  void merge_config();
  void setup_logging() const;
  std::vector<std::string> collect_expressions() const;
  void write_results() const;

  std::istream &in_;
  std::ostream &out_;
  CliOptions options_;
  Config config_;
  std::vector<ExpressionResult> results_;
  bool should_exit_{false};
};

} // namespace tparse

#endif // TIMEPARSE_APP_HPP
