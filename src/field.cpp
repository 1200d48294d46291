/**
 * @file field.cpp
 * @brief Field names, multipliers and numeral conversion.
 */
#include "field.hpp"
#include "duration_error.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>
#include <utility>

namespace tparse {

namespace {

bool all_digits(const std::string &text) {
  return !text.empty() &&
         std::all_of(text.begin(), text.end(), [](unsigned char c) {
           return std::isdigit(c) != 0;
         });
}

} // namespace

std::string_view field_name(Field field) {
  switch (field) {
  case Field::Weeks:
    return "weeks";
  case Field::Days:
    return "days";
  case Field::Hours:
    return "hours";
  case Field::Mins:
    return "mins";
  case Field::Secs:
    return "secs";
  case Field::Millis:
    return "millis";
  }
  return "secs";
}

std::optional<Field> field_from_name(std::string_view name) {
  for (Field field : kAllFields) {
    if (field_name(field) == name) {
      return field;
    }
  }
  return std::nullopt;
}

double multiplier(Field field) {
  if (field == Field::Millis) {
    return 1e-3;
  }
  return static_cast<double>(*integral_multiplier(field));
}

std::optional<std::int64_t> integral_multiplier(Field field) {
  switch (field) {
  case Field::Weeks:
    return 60 * 60 * 24 * 7;
  case Field::Days:
    return 60 * 60 * 24;
  case Field::Hours:
    return 60 * 60;
  case Field::Mins:
    return 60;
  case Field::Secs:
    return 1;
  case Field::Millis:
    return std::nullopt;
  }
  return std::nullopt;
}

Numeral::Numeral(std::string text)
    : text_(std::move(text)), integer_(all_digits(text_)) {}

std::int64_t Numeral::to_integer() const {
  if (!integer_) {
    throw DurationError(DurationErrorKind::InvalidNumeral,
                        "Not an integer numeral: '" + text_ + "'");
  }
  try {
    std::size_t idx = 0;
    long long value = std::stoll(text_, &idx, 10);
    if (idx != text_.size()) {
      throw DurationError(DurationErrorKind::InvalidNumeral,
                          "Trailing characters in numeral '" + text_ + "'");
    }
    return static_cast<std::int64_t>(value);
  } catch (const std::out_of_range &) {
    throw DurationError(DurationErrorKind::Overflow,
                        "Numeral out of range: '" + text_ + "'");
  }
}

double Numeral::to_real() const {
  auto dots = std::count(text_.begin(), text_.end(), '.');
  bool has_digit = std::any_of(text_.begin(), text_.end(), [](unsigned char c) {
    return std::isdigit(c) != 0;
  });
  bool only_number_chars =
      std::all_of(text_.begin(), text_.end(), [](unsigned char c) {
        return std::isdigit(c) != 0 || c == '.';
      });
  if (dots > 1 || !has_digit || !only_number_chars) {
    throw DurationError(DurationErrorKind::InvalidNumeral,
                        "Not a decimal numeral: '" + text_ + "'");
  }
  try {
    return std::stod(text_);
  } catch (const std::out_of_range &) {
    throw DurationError(DurationErrorKind::Overflow,
                        "Numeral out of range: '" + text_ + "'");
  } catch (const std::invalid_argument &) {
    throw DurationError(DurationErrorKind::InvalidNumeral,
                        "Not a decimal numeral: '" + text_ + "'");
  }
}

} // namespace tparse
