/**
 * @file parsed_duration.hpp
 * @brief Result of parsing a duration expression.
 */
#ifndef TIMEPARSE_PARSED_DURATION_HPP
#define TIMEPARSE_PARSED_DURATION_HPP

#include <chrono>
#include <cstdint>
#include <string>
#include <variant>

namespace tparse {

/**
 * Signed number of seconds produced by the parser.
 *
 * Exact results are held as a 64-bit integer. Results whose seconds field
 * carries a fraction, or that include milliseconds, are held as a double.
 */
class ParsedDuration {
public:
  /// Exact whole number of seconds.
  static ParsedDuration from_integer(std::int64_t seconds) {
    return ParsedDuration(seconds);
  }

  /// Fractional number of seconds.
  static ParsedDuration from_real(double seconds) {
    return ParsedDuration(seconds);
  }

  /** Check whether the value is an exact integer count. */
  bool is_integer() const {
    return std::holds_alternative<std::int64_t>(value_);
  }

  /// Whole seconds; only valid when is_integer() is true.
  std::int64_t integer() const { return std::get<std::int64_t>(value_); }

  /// Fractional seconds; only valid when is_integer() is false.
  double real() const { return std::get<double>(value_); }

  /// Value as a double regardless of representation.
  double seconds() const {
    return is_integer() ? static_cast<double>(integer()) : real();
  }

  /// Convert to a chrono duration.
  std::chrono::duration<double> to_chrono() const {
    return std::chrono::duration<double>(seconds());
  }

  /// Representation and value must both match.
  friend bool operator==(const ParsedDuration &a, const ParsedDuration &b) {
    return a.value_ == b.value_;
  }

  friend bool operator!=(const ParsedDuration &a, const ParsedDuration &b) {
    return !(a == b);
  }

private:
  explicit ParsedDuration(std::int64_t seconds) : value_(seconds) {}
  explicit ParsedDuration(double seconds) : value_(seconds) {}

  std::variant<std::int64_t, double> value_;
};

/**
 * @brief Plain numeric text of a parsed duration, e.g. "84" or "1.2".
 *
 * Doubles use the shortest representation that reads back to the same
 * value.
 */
std::string to_string(const ParsedDuration &duration);

} // namespace tparse

#endif // TIMEPARSE_PARSED_DURATION_HPP
