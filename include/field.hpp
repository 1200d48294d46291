/**
 * @file field.hpp
 * @brief Duration fields, their numerals, and second multipliers.
 *
 * A duration expression is decomposed into named fields (weeks down to
 * milliseconds). Each matched field keeps the numeral text exactly as it was
 * written so the reducer can decide between exact integer and floating point
 * arithmetic.
 */
#ifndef TIMEPARSE_FIELD_HPP
#define TIMEPARSE_FIELD_HPP

#include <array>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace tparse {

/** \brief Duration components ordered by descending magnitude. */
enum class Field { Weeks, Days, Hours, Mins, Secs, Millis };

/// Every field, largest unit first.
inline constexpr std::array<Field, 6> kAllFields = {
    Field::Weeks, Field::Days, Field::Hours,
    Field::Mins,  Field::Secs, Field::Millis};

/**
 * @brief Canonical name of a field ("weeks", "days", "hours", "mins",
 * "secs", "millis").
 */
std::string_view field_name(Field field);

/**
 * @brief Look up a field by its canonical name.
 * @param name Canonical field name.
 * @return Matching field, or std::nullopt for unknown names.
 */
std::optional<Field> field_from_name(std::string_view name);

/**
 * @brief Number of seconds one unit of @p field represents.
 *
 * Milliseconds yield 0.001; every other field is a whole number.
 */
double multiplier(Field field);

/**
 * @brief Whole-second multiplier of @p field.
 * @return Seconds per unit, or std::nullopt for Field::Millis.
 */
std::optional<std::int64_t> integral_multiplier(Field field);

/**
 * Numeral text captured for one field.
 *
 * The text is made of ASCII digits and dots. Whether it is a pure integer
 * numeral is decided once at construction.
 */
class Numeral {
public:
  explicit Numeral(std::string text);

  /// Text as written in the expression.
  const std::string &text() const { return text_; }

  /// True when the text is a non-empty run of ASCII digits.
  bool is_integer() const { return integer_; }

  /**
   * @brief Integer value of the numeral.
   * @throws DurationError InvalidNumeral when the text is not an integer
   *         numeral, Overflow when it exceeds std::int64_t.
   */
  std::int64_t to_integer() const;

  /**
   * @brief Floating point value of the numeral.
   * @throws DurationError InvalidNumeral for text such as "." or "1.2.3".
   */
  double to_real() const;

private:
  std::string text_;
  bool integer_;
};

/// Matched fields keyed by field, iterated largest unit first.
using FieldMap = std::map<Field, Numeral>;

} // namespace tparse

#endif // TIMEPARSE_FIELD_HPP
