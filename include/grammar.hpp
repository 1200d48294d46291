/**
 * @file grammar.hpp
 * @brief Ranked table of the duration expression formats.
 *
 * Five formats are recognised and tried in a fixed order: the compound word
 * form ("1h 30m"), the minute clock ("1:24"), weeks/days plus an hour clock
 * ("2d 1:00:00"), the day clock ("1:02:03:04") and the bare seconds clock
 * (":22"). The table is built once and never modified.
 */
#ifndef TIMEPARSE_GRAMMAR_HPP
#define TIMEPARSE_GRAMMAR_HPP

#include "field.hpp"

#include <regex>
#include <string>
#include <string_view>
#include <vector>

namespace tparse {

/** \brief Shape of a duration format. */
enum class FormatKind {
  Compound,    ///< Unit words, e.g. "1 week 2d 3h4m5s".
  MinuteClock, ///< "M:SS[.f]".
  HourClock,   ///< Optional weeks/days then "H:MM:SS[.f]".
  DayClock,    ///< "D:HH:MM:SS[.f]".
  SecondClock  ///< ":SS[.f]".
};

/**
 * @brief Short identifier of a format kind for logs.
 */
std::string_view to_string(FormatKind kind);

/**
 * One entry of the grammar table.
 *
 * @c captures maps capture group N + 1 of @c pattern to its field.
 */
struct TimeFormat {
  FormatKind kind;
  std::string source;          ///< Regex text before compilation.
  std::regex pattern;          ///< Case-insensitive, whole-string regex.
  std::vector<Field> captures; ///< Field for each capture group.
};

/**
 * @brief Access the grammar table in priority order.
 *
 * The table is built on first use; later calls return the same instance.
 */
const std::vector<TimeFormat> &time_formats();

} // namespace tparse

#endif // TIMEPARSE_GRAMMAR_HPP
