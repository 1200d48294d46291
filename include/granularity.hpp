/**
 * @file granularity.hpp
 * @brief Disambiguation hint for two-field clock expressions.
 *
 * "1:24" can mean one minute twenty-four seconds or one hour twenty-four
 * minutes. Granularity selects the reading.
 */
#ifndef TIMEPARSE_GRANULARITY_HPP
#define TIMEPARSE_GRANULARITY_HPP

#include <algorithm>
#include <cctype>
#include <optional>
#include <string>

namespace tparse {

/** \brief Smallest unit a bare "A:B" expression is read down to. */
enum class Granularity {
  Seconds, ///< "A:B" is minutes and seconds.
  Minutes  ///< "A:B" is hours and minutes.
};

/**
 * @brief Converts a Granularity to its string representation.
 * @param granularity The granularity.
 * @return "seconds" or "minutes".
 */
inline std::string to_string(Granularity granularity) {
  switch (granularity) {
  case Granularity::Seconds:
    return "seconds";
  case Granularity::Minutes:
    return "minutes";
  }
  return "seconds";
}

/**
 * @brief Parses a string to a Granularity value.
 * @param value String to parse (case-insensitive).
 * @return Optional Granularity if recognized, std::nullopt otherwise.
 */
inline std::optional<Granularity> granularity_from_string(std::string value) {
  std::transform(
      value.begin(), value.end(), value.begin(),
      [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  if (value == "seconds" || value == "second" || value == "secs" ||
      value == "sec" || value == "s") {
    return Granularity::Seconds;
  }
  if (value == "minutes" || value == "minute" || value == "mins" ||
      value == "min" || value == "m") {
    return Granularity::Minutes;
  }
  return std::nullopt;
}

} // namespace tparse

#endif // TIMEPARSE_GRANULARITY_HPP
