/**
 * @file duration.hpp
 * @brief Human-readable duration parsing.
 *
 * Parses duration expressions such as "1:24", "1.2 minutes", "-1d2h3m" or
 * "1:22:33.5" into a number of seconds. Results are exact integers whenever
 * the expression allows it and doubles otherwise.
 */
#ifndef TIMEPARSE_UTIL_DURATION_HPP
#define TIMEPARSE_UTIL_DURATION_HPP

#include "granularity.hpp"
#include "parsed_duration.hpp"

#include <cstdint>
#include <limits>
#include <optional>
#include <string_view>
#include <type_traits>

namespace tparse {

/**
 * Parse a duration expression into seconds.
 *
 * Accepted forms include unit words ("1 minute, 24 secs", "1m24s",
 * "2 weeks 3 days"), clocks ("1:24", "1:22:33.5", "1:02:03:04", ":22") and
 * plain numbers ("30", "3.9", truncated toward zero). A leading '+' or '-'
 * applies to the whole expression.
 *
 * @param text Expression to parse.
 * @param granularity Reading of two-field clocks such as "1:24".
 * @return Parsed duration, or std::nullopt when the text is not a duration.
 *         Never throws DurationError.
 */
std::optional<ParsedDuration>
parse_duration(std::string_view text,
               Granularity granularity = Granularity::Seconds);

/**
 * Truncate a numeric duration toward zero.
 *
 * @param seconds Number of seconds.
 * @return Whole seconds, or std::nullopt for NaN, infinities and values
 *         outside the 64-bit range.
 */
std::optional<ParsedDuration> parse_duration(double seconds);

/// Whole seconds are returned unchanged; unsigned values above the 64-bit
/// signed range yield std::nullopt.
template <typename T, std::enable_if_t<std::is_integral_v<T>, int> = 0>
std::optional<ParsedDuration> parse_duration(T seconds) {
  if constexpr (std::is_unsigned_v<T>) {
    if (seconds > static_cast<std::make_unsigned_t<std::int64_t>>(
                      std::numeric_limits<std::int64_t>::max())) {
      return std::nullopt;
    }
  }
  return ParsedDuration::from_integer(static_cast<std::int64_t>(seconds));
}

/**
 * Parse a duration expression, reporting failures.
 *
 * Same rules as parse_duration() but failures surface as exceptions so the
 * caller can tell why the text was rejected.
 *
 * @throws DurationError With the kind of failure.
 */
ParsedDuration evaluate_duration(std::string_view text,
                                 Granularity granularity = Granularity::Seconds);

} // namespace tparse

#endif // TIMEPARSE_UTIL_DURATION_HPP
