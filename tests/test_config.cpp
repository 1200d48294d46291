#include "config.hpp"
#include <catch2/catch_test_macros.hpp>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>
#include <stdexcept>

using namespace tparse;

namespace {
std::string temp_path(const std::string &name) {
  return (std::filesystem::temp_directory_path() / name).string();
}
} // namespace

TEST_CASE("config defaults") {
  Config cfg;
  CHECK(cfg.granularity() == Granularity::Seconds);
  CHECK(cfg.output_format() == OutputFormat::Text);
  CHECK_FALSE(cfg.fail_fast());
  CHECK_FALSE(cfg.verbose());
  CHECK(cfg.log_level() == "info");
  CHECK(cfg.log_rotate() == 3);
  CHECK(cfg.log_categories().empty());
}

TEST_CASE("config from yaml") {
  const std::string path = temp_path("timeparse_cfg.yaml");
  {
    std::ofstream f(path);
    f << "core:\n";
    f << "  granularity: minutes\n";
    f << "  fail_fast: true\n";
    f << "  verbose: true\n";
    f << "output:\n";
    f << "  output_format: json\n";
    f << "logging:\n";
    f << "  log_level: debug\n";
    f << "  log_pattern: \"%v\"\n";
    f << "  log_file: timeparse.log\n";
    f << "  log_rotate: 5\n";
    f << "  log_categories:\n";
    f << "    parser: trace\n";
    f << "    config:\n";
  }
  Config cfg = Config::from_file(path);
  CHECK(cfg.granularity() == Granularity::Minutes);
  CHECK(cfg.fail_fast());
  CHECK(cfg.verbose());
  CHECK(cfg.output_format() == OutputFormat::Json);
  CHECK(cfg.log_level() == "debug");
  CHECK(cfg.log_pattern() == "%v");
  CHECK(cfg.log_file() == "timeparse.log");
  CHECK(cfg.log_rotate() == 5);
  REQUIRE(cfg.log_categories().size() == 2);
  CHECK(cfg.log_categories().at("parser") == "trace");
  CHECK(cfg.log_categories().at("config") == "debug");
  std::remove(path.c_str());
}

TEST_CASE("config from json file") {
  const std::string path = temp_path("timeparse_cfg.json");
  {
    std::ofstream f(path);
    f << R"({"granularity": "m", "output_format": "text",)"
      << R"( "log_categories": ["app=warn", "parser"]})";
  }
  Config cfg = Config::from_file(path);
  CHECK(cfg.granularity() == Granularity::Minutes);
  CHECK(cfg.output_format() == OutputFormat::Text);
  CHECK(cfg.log_categories().at("app") == "warn");
  CHECK(cfg.log_categories().at("parser") == "debug");
  std::remove(path.c_str());
}

TEST_CASE("config from toml") {
  const std::string path = temp_path("timeparse_cfg.toml");
  {
    std::ofstream f(path);
    f << "[core]\n";
    f << "granularity = \"seconds\"\n";
    f << "[logging]\n";
    f << "log_level = \"warn\"\n";
    f << "log_rotate = 0\n";
    f << "[output]\n";
    f << "output_format = \"json\"\n";
    f << "fail_fast = true\n";
  }
  Config cfg = Config::from_file(path);
  CHECK(cfg.granularity() == Granularity::Seconds);
  CHECK(cfg.log_level() == "warn");
  CHECK(cfg.log_rotate() == 0);
  CHECK(cfg.output_format() == OutputFormat::Json);
  CHECK(cfg.fail_fast());
  std::remove(path.c_str());
}

TEST_CASE("config from json object") {
  nlohmann::json j = {{"granularity", "MINUTES"},
                      {"log_rotate", -4},
                      {"log_categories", "cli=trace"}};
  Config cfg = Config::from_json(j);
  CHECK(cfg.granularity() == Granularity::Minutes);
  CHECK(cfg.log_rotate() == 0);
  CHECK(cfg.log_categories().at("cli") == "trace");
}

TEST_CASE("config rejects unknown values") {
  CHECK_THROWS_AS(Config::from_json({{"granularity", "hours"}}),
                  std::runtime_error);
  CHECK_THROWS_AS(Config::from_json({{"output_format", "xml"}}),
                  std::runtime_error);
  CHECK_THROWS(Config::from_json({{"fail_fast", "yes"}}));
}

TEST_CASE("config rejects unsupported files") {
  CHECK_THROWS_AS(Config::from_file(temp_path("timeparse_cfg")),
                  std::runtime_error);
  CHECK_THROWS_AS(Config::from_file(temp_path("timeparse_cfg.ini")),
                  std::runtime_error);
  CHECK_THROWS(Config::from_file(temp_path("timeparse_missing.json")));
}

TEST_CASE("output format names") {
  CHECK(output_format_from_string("JSON") == OutputFormat::Json);
  CHECK(output_format_from_string("plain") == OutputFormat::Text);
  CHECK_FALSE(output_format_from_string("csv"));
  CHECK(to_string(OutputFormat::Json) == "json");
}
