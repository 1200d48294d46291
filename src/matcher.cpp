#include "matcher.hpp"
#include "duration_error.hpp"
#include "log.hpp"
#include "sign.hpp"

#include <memory>
#include <regex>
#include <string>

#include <spdlog/spdlog.h>

namespace tparse {

namespace {
std::shared_ptr<spdlog::logger> parser_log() {
  ensure_default_logger();
  return category_logger("parser");
}
} // namespace

std::optional<FieldMatch> match_time_format(std::string_view remainder) {
  if (remainder.size() > kMaxExpressionLength) {
    throw DurationError(DurationErrorKind::Malformed,
                        "Duration expression longer than " +
                            std::to_string(kMaxExpressionLength) +
                            " characters");
  }
  if (trim(remainder).empty()) {
    return std::nullopt;
  }
  const std::string text(remainder);
  for (const auto &format : time_formats()) {
    std::smatch match;
    if (!std::regex_match(text, match, format.pattern)) {
      continue;
    }
    if (match.size() != format.captures.size() + 1) {
      throw DurationError(DurationErrorKind::Internal,
                          "Format " + std::string(to_string(format.kind)) +
                              " has unmapped capture groups");
    }
    FieldMatch result;
    result.kind = format.kind;
    for (std::size_t i = 0; i < format.captures.size(); ++i) {
      const auto &group = match[i + 1];
      if (group.matched) {
        result.fields.emplace(format.captures[i], Numeral(group.str()));
      }
    }
    parser_log()->trace("'{}' matched {} format with {} field(s)", text,
                        to_string(format.kind), result.fields.size());
    return result;
  }
  parser_log()->trace("'{}' matched no duration format", text);
  return std::nullopt;
}

} // namespace tparse
