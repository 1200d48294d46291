/**
 * @file grammar.cpp
 * @brief Builds the ranked table of duration formats.
 *
 * Formats are composed from small regex fragments. Each fragment carries the
 * fields of its capture groups in order so the composed expression knows
 * which group holds which field.
 */
#include "grammar.hpp"

#include <utility>

namespace tparse {

namespace {

/// Regex text plus the fields captured by its groups, left to right.
struct Fragment {
  std::string regex;
  std::vector<Field> captures;
};

Fragment operator+(Fragment lhs, const Fragment &rhs) {
  lhs.regex += rhs.regex;
  lhs.captures.insert(lhs.captures.end(), rhs.captures.begin(),
                      rhs.captures.end());
  return lhs;
}

Fragment literal(std::string regex) { return Fragment{std::move(regex), {}}; }

/// Numeral followed by one of the unit spellings of @p field.
Fragment unit_field(Field field, const std::string &units) {
  return Fragment{"([0-9.]+)\\s*(?:" + units + ")", {field}};
}

Fragment optional(Fragment inner) {
  inner.regex = "(?:" + inner.regex + ")?";
  return inner;
}

/// Optional field that may be followed by a ',' or '/' separator.
Fragment optional_separated(Fragment inner) {
  inner.regex = "(?:" + inner.regex + "\\s*(?:[,/]\\s*)?)?";
  return inner;
}

const Fragment kSpace = literal("\\s*");

Fragment weeks() { return unit_field(Field::Weeks, "w|wks?|weeks?"); }
Fragment days() { return unit_field(Field::Days, "d|dys?|days?"); }
Fragment hours() { return unit_field(Field::Hours, "h|hrs?|hours?"); }
Fragment mins() { return unit_field(Field::Mins, "m|mins?|minutes?"); }
Fragment secs() { return unit_field(Field::Secs, "s|secs?|seconds?"); }
Fragment millis() {
  return unit_field(Field::Millis, "ms|msecs?|millis|milliseconds?");
}

/// Two-digit seconds with an optional fraction, as used by the clocks.
Fragment clock_seconds() {
  return Fragment{"([0-9]{2}(?:\\.[0-9]+)?)", {Field::Secs}};
}

Fragment second_clock() { return literal(":") + clock_seconds(); }

Fragment minute_clock() {
  return Fragment{"([0-9]{1,2}):", {Field::Mins}} + clock_seconds();
}

Fragment hour_clock() {
  return Fragment{"([0-9]+):", {Field::Hours}} +
         Fragment{"([0-9]{2}):", {Field::Mins}} + clock_seconds();
}

Fragment day_clock() {
  return Fragment{"([0-9]+):", {Field::Days}} +
         Fragment{"([0-9]{2}):", {Field::Hours}} +
         Fragment{"([0-9]{2}):", {Field::Mins}} + clock_seconds();
}

TimeFormat compile(FormatKind kind, const Fragment &body) {
  Fragment anchored = kSpace + body + kSpace;
  return TimeFormat{kind, anchored.regex,
                    std::regex(anchored.regex, std::regex::ECMAScript |
                                                   std::regex::icase),
                    anchored.captures};
}

std::vector<TimeFormat> build_time_formats() {
  std::vector<TimeFormat> formats;
  formats.reserve(5);
  formats.push_back(compile(
      FormatKind::Compound, optional_separated(weeks()) + kSpace +
                                optional_separated(days()) + kSpace +
                                optional_separated(hours()) + kSpace +
                                optional_separated(mins()) + kSpace +
                                optional(secs()) + kSpace +
                                optional(millis())));
  formats.push_back(compile(FormatKind::MinuteClock, minute_clock()));
  formats.push_back(compile(FormatKind::HourClock,
                            optional_separated(weeks()) + kSpace +
                                optional_separated(days()) + kSpace +
                                hour_clock()));
  formats.push_back(compile(FormatKind::DayClock, day_clock()));
  formats.push_back(compile(FormatKind::SecondClock, second_clock()));
  return formats;
}

} // namespace

std::string_view to_string(FormatKind kind) {
  switch (kind) {
  case FormatKind::Compound:
    return "compound";
  case FormatKind::MinuteClock:
    return "minute-clock";
  case FormatKind::HourClock:
    return "hour-clock";
  case FormatKind::DayClock:
    return "day-clock";
  case FormatKind::SecondClock:
    return "second-clock";
  }
  return "compound";
}

const std::vector<TimeFormat> &time_formats() {
  static const std::vector<TimeFormat> formats = build_time_formats();
  return formats;
}

} // namespace tparse
