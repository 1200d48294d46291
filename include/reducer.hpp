/**
 * @file reducer.hpp
 * @brief Reduces matched fields to a signed number of seconds.
 */
#ifndef TIMEPARSE_REDUCER_HPP
#define TIMEPARSE_REDUCER_HPP

#include "granularity.hpp"
#include "matcher.hpp"
#include "parsed_duration.hpp"

#include <string_view>

namespace tparse {

/**
 * Reread a bare minute clock ("1:24") as hours and minutes.
 *
 * Applies only to MinuteClock matches whose text holds exactly one colon and
 * no decimal point, and which carry no hours, days or weeks. The minutes
 * value becomes hours, the seconds value becomes minutes and seconds are
 * dropped.
 *
 * @param remainder Unsigned expression the match was taken from.
 * @param match Match to rewrite in place.
 * @return True when the match was rewritten.
 */
bool interpret_as_minutes(std::string_view remainder, FieldMatch &match);

/**
 * Sum the fields of a match into seconds.
 *
 * - Integer numerals only: exact integer. Milliseconds contribute a
 *   fraction and turn the result into a double.
 * - Seconds absent or integral: integer. The other fields are summed as
 *   doubles, the sum is multiplied by @p sign and truncated toward zero,
 *   then the unsigned seconds value is added.
 * - Fractional seconds: double sum of all fields times @p sign.
 *
 * @param fields Matched fields.
 * @param sign +1 or -1.
 * @throws DurationError InvalidNumeral or Overflow.
 */
ParsedDuration reduce_fields(const FieldMap &fields, int sign);

/**
 * Read a remainder that matched no format as a decimal number of seconds.
 *
 * The number is truncated toward zero, so "3.9" yields 3.
 *
 * @throws DurationError Malformed when the text is not a finite decimal
 *         number, Overflow when it does not fit std::int64_t.
 */
ParsedDuration reduce_plain_number(std::string_view remainder, int sign);

/**
 * @brief Truncate @p value toward zero into a 64-bit integer.
 * @throws DurationError Overflow for non-finite or out-of-range values.
 */
std::int64_t truncate_seconds(double value);

} // namespace tparse

#endif // TIMEPARSE_REDUCER_HPP
