#include "app.hpp"
#include <catch2/catch_test_macros.hpp>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <sstream>
#include <string>

using namespace tparse;

TEST_CASE("app prints one value per expression", "[app]") {
  std::istringstream in;
  std::ostringstream out;
  App app(in, out);
  char prog[] = "prog";
  char expr1[] = "1:24";
  char expr2[] = "1.2 seconds";
  char *argv[] = {prog, expr1, expr2};
  CHECK(app.run(3, argv) == 0);
  CHECK(out.str() == "84\n1.2\n");
  REQUIRE(app.results().size() == 2);
  CHECK(app.results()[0].input == "1:24");
  CHECK_FALSE(app.should_exit());
}

TEST_CASE("app honours granularity", "[app]") {
  std::istringstream in;
  std::ostringstream out;
  App app(in, out);
  char prog[] = "prog";
  char expr[] = "1:24";
  char g_flag[] = "-g";
  char minutes[] = "minutes";
  char *argv[] = {prog, expr, g_flag, minutes};
  CHECK(app.run(4, argv) == 0);
  CHECK(out.str() == "5040\n");
}

TEST_CASE("app reads expressions from stdin", "[app]") {
  std::istringstream in("1m\n\n  \n:22\n-1d2h3m\n");
  std::ostringstream out;
  App app(in, out);
  char prog[] = "prog";
  char *argv[] = {prog};
  CHECK(app.run(1, argv) == 0);
  CHECK(app.options().read_stdin);
  CHECK(out.str() == "60\n22\n-93780\n");
}

TEST_CASE("app reports unparseable expressions", "[app]") {
  std::istringstream in;
  std::ostringstream out;
  App app(in, out);
  char prog[] = "prog";
  char good[] = "1m";
  char bad[] = "bogus";
  char tail[] = "2m";
  char *argv[] = {prog, good, bad, tail};
  CHECK(app.run(4, argv) == 1);
  CHECK(out.str() == "60\n120\n");
  REQUIRE(app.results().size() == 3);
  CHECK_FALSE(app.results()[1].value);
}

TEST_CASE("app stops at the first failure with fail-fast", "[app]") {
  std::istringstream in;
  std::ostringstream out;
  App app(in, out);
  char prog[] = "prog";
  char fail_fast[] = "--fail-fast";
  char bad[] = "bogus";
  char good[] = "1m";
  char *argv[] = {prog, fail_fast, bad, good};
  CHECK(app.run(4, argv) == 1);
  CHECK(app.results().size() == 1);
  CHECK(out.str().empty());
}

TEST_CASE("app writes json results", "[app]") {
  std::istringstream in;
  std::ostringstream out;
  App app(in, out);
  char prog[] = "prog";
  char o_flag[] = "-o";
  char json[] = "json";
  char expr1[] = "1:24";
  char expr2[] = "1:22:33.5";
  char expr3[] = "nope";
  char *argv[] = {prog, o_flag, json, expr1, expr2, expr3};
  CHECK(app.run(6, argv) == 1);
  auto doc = nlohmann::json::parse(out.str());
  REQUIRE(doc.is_array());
  REQUIRE(doc.size() == 3);
  CHECK(doc[0]["input"] == "1:24");
  CHECK(doc[0]["seconds"] == 84);
  CHECK(doc[0]["exact"] == true);
  CHECK(doc[1]["seconds"].get<double>() == 4953.5);
  CHECK(doc[1]["exact"] == false);
  CHECK(doc[2]["seconds"].is_null());
}

TEST_CASE("app merges the configuration file", "[app]") {
  const std::string path =
      (std::filesystem::temp_directory_path() / "timeparse_app.yaml").string();
  {
    std::ofstream f(path);
    f << "core:\n";
    f << "  granularity: minutes\n";
  }
  char prog[] = "prog";
  char c_flag[] = "-C";
  std::string path_copy = path;
  char *config_path = path_copy.data();
  char expr[] = "1:24";

  std::istringstream in1;
  std::ostringstream out1;
  App from_config(in1, out1);
  char *argv1[] = {prog, c_flag, config_path, expr};
  CHECK(from_config.run(4, argv1) == 0);
  CHECK(from_config.config().granularity() == Granularity::Minutes);
  CHECK(out1.str() == "5040\n");

  std::istringstream in2;
  std::ostringstream out2;
  App overridden(in2, out2);
  char g_flag[] = "-g";
  char seconds[] = "seconds";
  char *argv2[] = {prog, c_flag, config_path, g_flag, seconds, expr};
  CHECK(overridden.run(6, argv2) == 0);
  CHECK(out2.str() == "84\n");
  std::remove(path.c_str());
}

TEST_CASE("app fails on a broken configuration file", "[app]") {
  std::istringstream in;
  std::ostringstream out;
  App app(in, out);
  char prog[] = "prog";
  char c_flag[] = "-C";
  char missing[] = "timeparse_missing_config.ini";
  char expr[] = "1m";
  char *argv[] = {prog, c_flag, missing, expr};
  CHECK(app.run(4, argv) == 1);
  CHECK(app.should_exit());
  CHECK(out.str().empty());
}

TEST_CASE("app exits early for help", "[app]") {
  std::istringstream in;
  std::ostringstream out;
  App app(in, out);
  char prog[] = "prog";
  char help[] = "--help";
  char *argv[] = {prog, help};
  CHECK(app.run(2, argv) == 0);
  CHECK(app.should_exit());
  CHECK(app.results().empty());
}

TEST_CASE("app writes the log file named in the configuration", "[app]") {
  const auto dir = std::filesystem::temp_directory_path();
  const std::string cfg_path = (dir / "timeparse_app_log.yaml").string();
  const std::string log_path = (dir / "timeparse_app_log.log").string();
  std::remove(log_path.c_str());
  {
    std::ofstream f(cfg_path);
    f << "logging:\n";
    f << "  log_file: \"" << log_path << "\"\n";
    f << "  log_rotate: 0\n";
  }
  std::istringstream in;
  std::ostringstream out;
  App app(in, out);
  char prog[] = "prog";
  char c_flag[] = "-C";
  std::string cfg_copy = cfg_path;
  char bad[] = "bogus";
  char *argv[] = {prog, c_flag, cfg_copy.data(), bad};
  CHECK(app.run(4, argv) == 1);
  spdlog::shutdown();

  std::ifstream log(log_path);
  REQUIRE(log.good());
  std::string content((std::istreambuf_iterator<char>(log)),
                      std::istreambuf_iterator<char>());
  CHECK(content.find("cannot parse 'bogus'") != std::string::npos);
  log.close();
  std::remove(log_path.c_str());
  std::remove(cfg_path.c_str());
}

TEST_CASE("explicit log level overrides the configuration", "[app]") {
  const std::string path =
      (std::filesystem::temp_directory_path() / "timeparse_app_level.yaml")
          .string();
  {
    std::ofstream f(path);
    f << "logging:\n";
    f << "  log_level: debug\n";
  }
  char prog[] = "prog";
  char c_flag[] = "-C";
  std::string path_copy = path;
  char expr[] = "1m";

  std::istringstream in1;
  std::ostringstream out1;
  App from_config(in1, out1);
  char *argv1[] = {prog, c_flag, path_copy.data(), expr};
  CHECK(from_config.run(4, argv1) == 0);
  CHECK(from_config.options().log_level == "debug");

  std::istringstream in2;
  std::ostringstream out2;
  App overridden(in2, out2);
  char g_flag[] = "-G";
  char info[] = "info";
  char *argv2[] = {prog, c_flag, path_copy.data(), g_flag, info, expr};
  CHECK(overridden.run(6, argv2) == 0);
  CHECK(overridden.options().log_level == "info");
  CHECK(spdlog::default_logger()->level() == spdlog::level::info);
  std::remove(path.c_str());
}
