#include "cli.hpp"
#include "log.hpp"
#include "version.hpp"
#include <CLI/CLI.hpp>
#include <array>
#include <cstdint>
#include <iostream>
#include <memory>
#include <sstream>
#include <string_view>

#include <spdlog/spdlog.h>

namespace tparse {

namespace {
std::shared_ptr<spdlog::logger> cli_log() {
  ensure_default_logger();
  return category_logger("cli");
}

std::string log_category_help_text() {
  static const std::array<std::string_view, 6> categories = {
      "app", "cli", "config", "logging", "main", "parser"};
  std::ostringstream oss;
  oss << "Logging categories: ";
  for (std::size_t i = 0; i < categories.size(); ++i) {
    if (i != 0) {
      oss << ", ";
    }
    oss << categories[i];
  }
  oss << "\nUse --log-category NAME=LEVEL to override (e.g., "
         "parser=trace).";
  oss << " Configuration files accept the same mapping under 'log_categories'.";
  oss << "\nExpressions starting with '-' followed by a space must come "
         "after '--'.";
  return oss.str();
}
} // namespace

CliOptions parse_cli(int argc, char **argv) {
  CLI::App app{"Convert human-written durations to seconds"};
  app.footer(log_category_help_text());
  CliOptions options;
  app.add_option("EXPR", options.expressions,
                 "Duration expressions such as 1:24, '1m 24s' or -1d2h")
      ->group("Input");
  app.add_flag("-i,--stdin", options.read_stdin,
               "Read one expression per line from standard input")
      ->group("Input");
  app.add_option_function<std::string>(
         "-g,--granularity",
         [&options](const std::string &value) {
           auto granularity = granularity_from_string(value);
           if (!granularity) {
             throw CLI::ValidationError("--granularity",
                                        "must be one of: seconds, minutes");
           }
           options.granularity = *granularity;
           options.granularity_explicit = true;
         },
         "Reading of two-field clocks like 1:24 (seconds = M:S, "
         "minutes = H:M)")
      ->type_name("UNIT")
      ->group("Parsing");
  app.add_flag("--fail-fast", options.fail_fast,
               "Stop at the first expression that cannot be parsed")
      ->group("Parsing");
  app.add_option_function<std::string>(
         "-o,--output",
         [&options](const std::string &value) {
           auto format = output_format_from_string(value);
           if (!format) {
             throw CLI::ValidationError("--output",
                                        "must be one of: text, json");
           }
           options.output_format = *format;
           options.output_format_explicit = true;
         },
         "Output format (text, json)")
      ->type_name("FORMAT")
      ->group("Output");
  app.add_flag("-v,--verbose", options.verbose, "Enable verbose output")
      ->group("General");
  app.add_option("-C,--config", options.config_file,
                 "Path to configuration file")
      ->type_name("FILE")
      ->group("General");
  app.add_flag_function(
         "--version",
         [](std::int64_t) {
           std::cout << "timeparse " << kVersionString << std::endl;
           throw CliParseExit(0);
         },
         "Show version information and exit")
      ->group("General");
  app.add_option_function<std::string>(
         "-G,--log-level",
         [&options](const std::string &value) {
           options.log_level = value;
           options.log_level_explicit = true;
         },
         "Set logging level (trace, debug, info, warn, error, critical, off)")
      ->type_name("LEVEL")
      ->group("Logging");
  app.add_option("-F,--log-file", options.log_file, "Path to log file")
      ->type_name("FILE")
      ->group("Logging");
  app.add_option_function<std::string>(
         "--log-category",
         [&options](const std::string &value) {
           auto pos = value.find('=');
           std::string name =
               pos == std::string::npos ? value : value.substr(0, pos);
           std::string level = pos == std::string::npos ? std::string{"debug"}
                                                        : value.substr(pos + 1);
           if (name.empty()) {
             throw CLI::ValidationError("--log-category",
                                        "category name must not be empty");
           }
           if (level.empty()) {
             level = "debug";
           }
           options.log_categories[name] = level;
           options.log_categories_explicit = true;
         },
         "Enable a logging category (NAME or NAME=LEVEL). See help footer for "
         "available categories.")
      ->type_name("NAME[=LEVEL]")
      ->group("Logging");
  app.add_option_function<int>(
         "--log-rotate",
         [&options](int value) {
           if (value < 0) {
             throw CLI::ValidationError("--log-rotate",
                                        "rotation count must be non-negative");
           }
           options.log_rotate = value;
           options.log_rotate_explicit = true;
         },
         "Number of rotated log files to retain (0 disables rotation)")
      ->type_name("N")
      ->group("Logging");
  try {
    app.parse(argc, argv);
  } catch (const CLI::ParseError &e) {
    int exit_code = app.exit(e);
    throw CliParseExit(exit_code);
  }
  if (options.expressions.empty() && !options.read_stdin) {
    cli_log()->debug("No expressions given; reading standard input");
    options.read_stdin = true;
  }
  return options;
}

} // namespace tparse
