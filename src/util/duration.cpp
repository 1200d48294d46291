#include "util/duration.hpp"
#include "duration_error.hpp"
#include "log.hpp"
#include "matcher.hpp"
#include "reducer.hpp"
#include "sign.hpp"

#include <exception>
#include <memory>
#include <string>

#include <spdlog/spdlog.h>

namespace tparse {

namespace {
std::shared_ptr<spdlog::logger> parser_log() {
  ensure_default_logger();
  return category_logger("parser");
}
} // namespace

/**
 * Run the sign, match and reduce stages on a text expression.
 *
 * @param text Expression to parse.
 * @param granularity Reading of two-field clocks.
 * @return Parsed duration.
 * @throws DurationError When the text cannot be parsed.
 */
ParsedDuration evaluate_duration(std::string_view text,
                                 Granularity granularity) {
  SignedText signed_text = extract_sign(text);
  auto match = match_time_format(signed_text.remainder);
  if (!match) {
    return reduce_plain_number(signed_text.remainder, signed_text.sign);
  }
  if (granularity == Granularity::Minutes &&
      interpret_as_minutes(signed_text.remainder, *match)) {
    parser_log()->trace("'{}' read as hours and minutes",
                        signed_text.remainder);
  }
  return reduce_fields(match->fields, signed_text.sign);
}

std::optional<ParsedDuration> parse_duration(std::string_view text,
                                             Granularity granularity) {
  try {
    return evaluate_duration(text, granularity);
  } catch (const DurationError &e) {
    parser_log()->debug("Cannot parse duration '{}' ({}): {}", text,
                        to_string(e.kind()), e.what());
  } catch (const std::exception &e) {
    parser_log()->debug("Cannot parse duration '{}': {}", text, e.what());
  }
  return std::nullopt;
}

std::optional<ParsedDuration> parse_duration(double seconds) {
  try {
    return ParsedDuration::from_integer(truncate_seconds(seconds));
  } catch (const DurationError &e) {
    parser_log()->debug("Cannot use {} as a duration: {}", seconds, e.what());
  }
  return std::nullopt;
}

} // namespace tparse
