#include "app.hpp"
#include "cli.hpp"
#include "config.hpp"
#include "log.hpp"
#include "sign.hpp"
#include "util/duration.hpp"
#include <exception>
#include <iostream>
#include <memory>
#include <string>
#include <unordered_map>
#include <utility>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace tparse {

namespace {
std::shared_ptr<spdlog::logger> app_log() {
  ensure_default_logger();
  return category_logger("app");
}

nlohmann::json result_to_json(const ExpressionResult &result) {
  nlohmann::json entry;
  entry["input"] = result.input;
  if (!result.value) {
    entry["seconds"] = nullptr;
    entry["exact"] = false;
  } else if (result.value->is_integer()) {
    entry["seconds"] = result.value->integer();
    entry["exact"] = true;
  } else {
    entry["seconds"] = result.value->real();
    entry["exact"] = false;
  }
  return entry;
}
} // namespace

App::App() : App(std::cin, std::cout) {}

App::App(std::istream &in, std::ostream &out) : in_(in), out_(out) {}

/**
 * Execute the main application flow.
 *
 * Parses the command line, loads the optional configuration file,
 * initializes logging, then parses every expression and prints the results.
 *
 * @param argc Argument count passed from @c main().
 * @param argv Argument vector passed from @c main().
 * @return Process exit code.
 */
int App::run(int argc, char **argv) {
  should_exit_ = false;
  results_.clear();
  try {
    options_ = parse_cli(argc, argv);
  } catch (const CliParseExit &exit) {
    should_exit_ = true;
    return exit.exit_code();
  }
  try {
    if (!options_.config_file.empty()) {
      config_ = Config::from_file(options_.config_file);
    }
    merge_config();
    setup_logging();
  } catch (const std::exception &e) {
    app_log()->error("{}", e.what());
    should_exit_ = true;
    return 1;
  }
  app_log()->debug("Parsing with granularity '{}'",
                   to_string(options_.granularity));

  bool failed = false;
  for (const auto &expression : collect_expressions()) {
    ExpressionResult result{expression,
                            parse_duration(expression, options_.granularity)};
    if (!result.value) {
      failed = true;
      app_log()->error("cannot parse '{}'", expression);
    }
    results_.push_back(std::move(result));
    if (failed && options_.fail_fast) {
      app_log()->warn("Stopping after first unparseable expression");
      break;
    }
  }
  write_results();
  app_log()->debug("Parsed {} expression(s)", results_.size());
  return failed ? 1 : 0;
}

/// Fill options not given on the command line from the configuration.
void App::merge_config() {
  if (!options_.granularity_explicit) {
    options_.granularity = config_.granularity();
  }
  if (!options_.output_format_explicit) {
    options_.output_format = config_.output_format();
  }
  options_.fail_fast = options_.fail_fast || config_.fail_fast();
  options_.verbose = options_.verbose || config_.verbose();
  if (!options_.log_rotate_explicit) {
    options_.log_rotate = config_.log_rotate();
  }
  if (!options_.log_categories_explicit) {
    options_.log_categories = config_.log_categories();
  }
  if (options_.log_file.empty()) {
    options_.log_file = config_.log_file();
  }
  if (!options_.log_level_explicit) {
    options_.log_level = config_.log_level();
  }
}

void App::setup_logging() const {
  std::string level_str = options_.verbose ? "debug" : "info";
  if (options_.log_level_explicit || options_.log_level != "info") {
    level_str = options_.log_level;
  }
  // spdlog maps unknown names to "off"; only accept names it round-trips.
  spdlog::level::level_enum lvl = spdlog::level::from_str(level_str);
  if (lvl == spdlog::level::off && level_str != "off") {
    app_log()->warn("Unknown log level '{}'; using info", level_str);
    lvl = spdlog::level::info;
  }
  init_logger(lvl, config_.log_pattern(), options_.log_file,
              static_cast<std::size_t>(options_.log_rotate));
  std::unordered_map<std::string, spdlog::level::level_enum> category_levels;
  for (const auto &[category, name] : options_.log_categories) {
    auto category_level = spdlog::level::from_str(name);
    if (category_level == spdlog::level::off && name != "off") {
      app_log()->warn("Ignoring invalid log level '{}' for category '{}'",
                      name, category);
      continue;
    }
    category_levels[category] = category_level;
  }
  configure_log_categories(category_levels);
  if (options_.verbose) {
    app_log()->debug("Verbose mode enabled");
  }
}

std::vector<std::string> App::collect_expressions() const {
  std::vector<std::string> expressions = options_.expressions;
  if (options_.read_stdin) {
    std::string line;
    while (std::getline(in_, line)) {
      if (!trim(line).empty()) {
        expressions.push_back(line);
      }
    }
  }
  return expressions;
}

void App::write_results() const {
  if (options_.output_format == OutputFormat::Json) {
    nlohmann::json doc = nlohmann::json::array();
    for (const auto &result : results_) {
      doc.push_back(result_to_json(result));
    }
    out_ << doc.dump(2) << '\n';
    return;
  }
  for (const auto &result : results_) {
    if (result.value) {
      out_ << to_string(*result.value) << '\n';
    }
  }
  out_.flush();
}

} // namespace tparse
