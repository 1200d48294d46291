#include "config.hpp"
#include "log.hpp"
#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <fstream>
#include <iterator>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <toml++/toml.h>
#include <yaml-cpp/yaml.h>

namespace tparse {

namespace {

std::shared_ptr<spdlog::logger> config_log() {
  ensure_default_logger();
  return category_logger("config");
}

std::string to_lower_copy(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return value;
}

/// Integer value of a whole YAML scalar, if it is one.
std::optional<long long> scalar_as_integer(const std::string &s) {
  if (s.empty()) {
    return std::nullopt;
  }
  errno = 0;
  char *end = nullptr;
  long long value = std::strtoll(s.c_str(), &end, 0);
  if (errno != 0 || end != s.c_str() + s.size()) {
    return std::nullopt;
  }
  return value;
}

/// Floating point value of a whole YAML scalar, if it is one.
std::optional<double> scalar_as_double(const std::string &s) {
  if (s.empty()) {
    return std::nullopt;
  }
  errno = 0;
  char *end = nullptr;
  double value = std::strtod(s.c_str(), &end);
  if (errno != 0 || end != s.c_str() + s.size()) {
    return std::nullopt;
  }
  return value;
}

/**
 * Convert a YAML node into a structurally equivalent JSON object.
 *
 * The conversion preserves scalar types where possible and recursively maps
 * sequences and maps to JSON arrays and objects respectively.
 *
 * @param node YAML node to transform.
 * @return JSON value mirroring the YAML content.
 */
nlohmann::json yaml_to_json(const YAML::Node &node) {
  using nlohmann::json;
  switch (node.Type()) {
  case YAML::NodeType::Null:
    return nullptr;
  case YAML::NodeType::Scalar: {
    const std::string s = node.Scalar();
    if (s == "true" || s == "True" || s == "TRUE")
      return true;
    if (s == "false" || s == "False" || s == "FALSE")
      return false;
    if (auto i = scalar_as_integer(s))
      return *i;
    if (auto d = scalar_as_double(s))
      return *d;
    return s;
  }
  case YAML::NodeType::Sequence: {
    json arr = json::array();
    auto &array = arr.get_ref<json::array_t &>();
    array.reserve(node.size());
    std::transform(node.begin(), node.end(), std::back_inserter(array),
                   [](const YAML::Node &item) { return yaml_to_json(item); });
    return arr;
  }
  case YAML::NodeType::Map: {
    json obj = json::object();
    for (const auto &kv : node) {
      obj[kv.first.as<std::string>()] = yaml_to_json(kv.second);
    }
    return obj;
  }
  default:
    return nullptr;
  }
}

/**
 * Translate a TOML node to a JSON representation.
 *
 * @param node TOML node read from a parsed document.
 * @return JSON value containing the equivalent data.
 */
nlohmann::json toml_to_json(const toml::node &node) {
  using nlohmann::json;
  if (const auto *table = node.as_table()) {
    json obj = json::object();
    for (const auto &kv : *table) {
      obj[std::string(kv.first.str())] = toml_to_json(kv.second);
    }
    return obj;
  }

  if (const auto *array = node.as_array()) {
    json arr = json::array();
    arr.get_ref<json::array_t &>().reserve(array->size());
    for (const auto &item : *array) {
      arr.push_back(toml_to_json(item));
    }
    return arr;
  }

  if (const auto *value = node.as_boolean())
    return value->get();
  if (const auto *value = node.as_integer())
    return value->get();
  if (const auto *value = node.as_floating_point())
    return value->get();
  if (const auto *value = node.as_string())
    return value->get();

  auto stringify_temporal = [](const auto &temporal) {
    std::ostringstream oss;
    oss << temporal;
    return oss.str();
  };

  if (const auto *value = node.as_date())
    return stringify_temporal(value->get());
  if (const auto *value = node.as_time())
    return stringify_temporal(value->get());
  if (const auto *value = node.as_date_time())
    return stringify_temporal(value->get());

  return nullptr;
}

/**
 * Merge recognised configuration sections into the root object so grouped
 * configuration files can expose the same flat keys that the loader expects.
 */
nlohmann::json normalize_config_sections(const nlohmann::json &source) {
  nlohmann::json normalized = source;
  auto merge_section = [&normalized](std::string_view name) {
    auto it = normalized.find(std::string{name});
    if (it == normalized.end() || !it->is_object()) {
      return;
    }
    const nlohmann::json section = *it;
    for (const auto &[key, value] : section.items()) {
      normalized[key] = value;
    }
  };

  for (std::string_view section : {"core", "logging", "output"}) {
    merge_section(section);
  }

  return normalized;
}

/// Split "name=level" into its parts; a bare name maps to "debug".
std::pair<std::string, std::string> split_category(const std::string &raw) {
  auto pos = raw.find('=');
  if (pos == std::string::npos) {
    return {raw, "debug"};
  }
  return {raw.substr(0, pos), raw.substr(pos + 1)};
}

} // namespace

std::string to_string(OutputFormat format) {
  switch (format) {
  case OutputFormat::Text:
    return "text";
  case OutputFormat::Json:
    return "json";
  }
  return "text";
}

std::optional<OutputFormat> output_format_from_string(std::string value) {
  value = to_lower_copy(std::move(value));
  if (value == "text" || value == "plain") {
    return OutputFormat::Text;
  }
  if (value == "json") {
    return OutputFormat::Json;
  }
  return std::nullopt;
}

/**
 * Populate configuration values from a JSON document.
 *
 * @param j JSON document, flat or grouped into sections.
 * @throws nlohmann::json::exception When value conversions fail.
 * @throws std::runtime_error For unknown granularity or output format names.
 */
void Config::load_json(const nlohmann::json &j) {
  nlohmann::json cfg = normalize_config_sections(j);

  if (cfg.contains("verbose")) {
    set_verbose(cfg["verbose"].get<bool>());
  }
  if (cfg.contains("granularity")) {
    const auto name = cfg["granularity"].get<std::string>();
    auto granularity = granularity_from_string(name);
    if (!granularity) {
      config_log()->error("Unknown granularity '{}'", name);
      throw std::runtime_error("Unknown granularity: " + name);
    }
    set_granularity(*granularity);
  }
  if (cfg.contains("output_format")) {
    const auto name = cfg["output_format"].get<std::string>();
    auto format = output_format_from_string(name);
    if (!format) {
      config_log()->error("Unknown output format '{}'", name);
      throw std::runtime_error("Unknown output format: " + name);
    }
    set_output_format(*format);
  }
  if (cfg.contains("fail_fast")) {
    set_fail_fast(cfg["fail_fast"].get<bool>());
  }
  if (cfg.contains("log_level")) {
    set_log_level(cfg["log_level"].get<std::string>());
  }
  if (cfg.contains("log_pattern")) {
    set_log_pattern(cfg["log_pattern"].get<std::string>());
  }
  if (cfg.contains("log_file")) {
    set_log_file(cfg["log_file"].get<std::string>());
  }
  if (cfg.contains("log_rotate")) {
    set_log_rotate(cfg["log_rotate"].get<int>());
  }
  if (cfg.contains("log_categories")) {
    std::unordered_map<std::string, std::string> categories;
    const auto &value = cfg["log_categories"];
    auto assign_category = [&categories](std::string name, std::string level) {
      if (name.empty()) {
        return;
      }
      if (level.empty()) {
        level = "debug";
      }
      categories[std::move(name)] = std::move(level);
    };
    if (value.is_object()) {
      for (const auto &[key, v] : value.items()) {
        if (v.is_string()) {
          assign_category(key, v.get<std::string>());
        } else if (v.is_null()) {
          assign_category(key, "debug");
        } else {
          config_log()->warn("Unsupported value for log category '{}'; "
                             "expected string or null",
                             key);
        }
      }
    } else if (value.is_array()) {
      for (const auto &item : value) {
        if (!item.is_string()) {
          continue;
        }
        auto [name, level] = split_category(item.get<std::string>());
        assign_category(std::move(name), std::move(level));
      }
    } else if (value.is_string()) {
      auto [name, level] = split_category(value.get<std::string>());
      assign_category(std::move(name), std::move(level));
    }
    set_log_categories(std::move(categories));
  }
}

/**
 * Construct a configuration object from a JSON representation.
 *
 * @param j JSON document with configuration values.
 * @return Populated configuration instance.
 * @throws nlohmann::json::exception When value conversions fail.
 */
Config Config::from_json(const nlohmann::json &j) {
  Config cfg;
  cfg.load_json(j);
  return cfg;
}

/**
 * Load configuration from a file on disk.
 *
 * The file type is inferred from the extension and may be YAML, JSON, or
 * TOML. Errors during parsing are logged and rethrown.
 *
 * @param path Filesystem location of the configuration file.
 * @return Fully populated configuration object.
 * @throws std::runtime_error When the file cannot be opened, parsed, or when
 *         the extension is unsupported.
 */
Config Config::from_file(const std::string &path) {
  config_log()->debug("Loading config from {}", path);
  auto pos = path.find_last_of('.');
  if (pos == std::string::npos) {
    config_log()->error("Unknown config file extension for {}", path);
    throw std::runtime_error("Unknown config file extension");
  }
  std::string ext = path.substr(pos + 1);
  std::string ext_lower = to_lower_copy(ext);
  config_log()->debug("Detected config file type: {}", ext_lower);
  nlohmann::json j;
  try {
    if (ext_lower == "yaml" || ext_lower == "yml") {
      YAML::Node node = YAML::LoadFile(path);
      j = yaml_to_json(node);
    } else if (ext_lower == "json") {
      std::ifstream f(path);
      if (!f) {
        config_log()->error("Failed to open config file {}", path);
        throw std::runtime_error("Failed to open config file");
      }
      f >> j;
    } else if (ext_lower == "toml" || ext_lower == "tml") {
      toml::table tbl = toml::parse_file(path);
      j = toml_to_json(tbl);
    } else {
      config_log()->error("Unsupported config format: {}", ext);
      throw std::runtime_error("Unsupported config format");
    }
  } catch (const std::exception &e) {
    config_log()->error("Failed to load config {}: {}", path, e.what());
    throw;
  }
  Config cfg;
  cfg.load_json(j);
  config_log()->info("Config loaded successfully from {}", path);
  return cfg;
}

} // namespace tparse
