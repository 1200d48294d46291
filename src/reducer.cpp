/**
 * @file reducer.cpp
 * @brief Implements the field reduction and plain number fallback.
 *
 * Whole-unit fields are summed with 64-bit integers and checked for
 * overflow. Anything involving a fraction is summed in double precision in
 * field order, largest unit first.
 */
#include "reducer.hpp"
#include "duration_error.hpp"
#include "sign.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <limits>
#include <string>
#include <utility>

namespace tparse {

namespace {

using Limits = std::numeric_limits<std::int64_t>;

[[noreturn]] void throw_overflow() {
  throw DurationError(DurationErrorKind::Overflow,
                      "Duration does not fit in 64-bit seconds");
}

std::int64_t checked_add(std::int64_t a, std::int64_t b) {
  if ((b > 0 && a > Limits::max() - b) || (b < 0 && a < Limits::min() - b)) {
    throw_overflow();
  }
  return a + b;
}

std::int64_t checked_mul(std::int64_t a, std::int64_t b) {
  if (a == 0 || b == 0) {
    return 0;
  }
  if (a > 0 ? (b > 0 ? a > Limits::max() / b : b < Limits::min() / a)
            : (b > 0 ? a < Limits::min() / b : a < Limits::max() / b)) {
    throw_overflow();
  }
  return a * b;
}

bool all_integer(const FieldMap &fields) {
  return std::all_of(fields.begin(), fields.end(), [](const auto &entry) {
    return entry.second.is_integer();
  });
}

/**
 * Accept an optionally signed decimal literal with optional fraction and
 * exponent, e.g. "30", "-3.9", ".5", "1e3".
 */
bool is_decimal_literal(std::string_view text) {
  std::size_t i = 0;
  auto digits = [&text, &i] {
    std::size_t start = i;
    while (i < text.size() &&
           std::isdigit(static_cast<unsigned char>(text[i])) != 0) {
      ++i;
    }
    return i - start;
  };
  if (i < text.size() && (text[i] == '+' || text[i] == '-')) {
    ++i;
  }
  std::size_t mantissa = digits();
  if (i < text.size() && text[i] == '.') {
    ++i;
    mantissa += digits();
  }
  if (mantissa == 0) {
    return false;
  }
  if (i < text.size() && (text[i] == 'e' || text[i] == 'E')) {
    ++i;
    if (i < text.size() && (text[i] == '+' || text[i] == '-')) {
      ++i;
    }
    if (digits() == 0) {
      return false;
    }
  }
  return i == text.size();
}

} // namespace

bool interpret_as_minutes(std::string_view remainder, FieldMatch &match) {
  if (match.kind != FormatKind::MinuteClock) {
    return false;
  }
  if (std::count(remainder.begin(), remainder.end(), ':') != 1 ||
      remainder.find('.') != std::string_view::npos) {
    return false;
  }
  auto &fields = match.fields;
  if (fields.count(Field::Hours) != 0 || fields.count(Field::Days) != 0 ||
      fields.count(Field::Weeks) != 0) {
    return false;
  }
  auto mins = fields.find(Field::Mins);
  auto secs = fields.find(Field::Secs);
  if (mins == fields.end() || secs == fields.end()) {
    return false;
  }
  Numeral hours_value = mins->second;
  Numeral mins_value = secs->second;
  fields.clear();
  fields.emplace(Field::Hours, std::move(hours_value));
  fields.emplace(Field::Mins, std::move(mins_value));
  return true;
}

std::int64_t truncate_seconds(double value) {
  if (!std::isfinite(value)) {
    throw_overflow();
  }
  double truncated = std::trunc(value);
  // 2^63 is exactly representable; anything at or above it cannot fit.
  constexpr double kLimit = 9223372036854775808.0;
  if (truncated >= kLimit || truncated < -kLimit) {
    throw_overflow();
  }
  return static_cast<std::int64_t>(truncated);
}

ParsedDuration reduce_fields(const FieldMap &fields, int sign) {
  if (all_integer(fields)) {
    std::int64_t whole = 0;
    auto millis = fields.end();
    for (auto it = fields.begin(); it != fields.end(); ++it) {
      auto factor = integral_multiplier(it->first);
      if (!factor) {
        millis = it;
        continue;
      }
      whole = checked_add(whole, checked_mul(*factor, it->second.to_integer()));
    }
    if (millis != fields.end()) {
      double total = static_cast<double>(whole) +
                     multiplier(Field::Millis) * millis->second.to_real();
      return ParsedDuration::from_real(sign * total);
    }
    return ParsedDuration::from_integer(checked_mul(sign, whole));
  }

  auto secs = fields.find(Field::Secs);
  if (secs == fields.end() || secs->second.is_integer()) {
    double others = 0.0;
    for (const auto &[field, numeral] : fields) {
      if (field != Field::Secs) {
        others += multiplier(field) * numeral.to_real();
      }
    }
    std::int64_t seconds =
        secs == fields.end() ? 0 : secs->second.to_integer();
    return ParsedDuration::from_integer(
        checked_add(seconds, truncate_seconds(sign * others)));
  }

  double total = 0.0;
  for (const auto &[field, numeral] : fields) {
    total += multiplier(field) * numeral.to_real();
  }
  return ParsedDuration::from_real(sign * total);
}

ParsedDuration reduce_plain_number(std::string_view remainder, int sign) {
  std::string_view text = trim(remainder);
  if (!is_decimal_literal(text)) {
    throw DurationError(DurationErrorKind::Malformed,
                        "Not a duration: '" + std::string(remainder) + "'");
  }
  // strtod saturates to HUGE_VAL on overflow, which truncation rejects, and
  // rounds underflow to zero.
  const std::string literal(text);
  double value = std::strtod(literal.c_str(), nullptr);
  return ParsedDuration::from_integer(
      checked_mul(truncate_seconds(value), sign));
}

} // namespace tparse
