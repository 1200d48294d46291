/**
 * @file duration_error.hpp
 * @brief Exception type raised by the duration parsing pipeline.
 */
#ifndef TIMEPARSE_DURATION_ERROR_HPP
#define TIMEPARSE_DURATION_ERROR_HPP

#include <stdexcept>
#include <string>

namespace tparse {

/** \brief Reason a duration expression could not be evaluated. */
enum class DurationErrorKind {
  Malformed,      ///< Text matches no format and is not a plain number.
  InvalidNumeral, ///< A matched field holds text that is not a number.
  Overflow,       ///< Result does not fit a 64-bit integer.
  Internal        ///< Grammar produced a capture without a field mapping.
};

/**
 * @brief Converts a DurationErrorKind to a short label.
 * @param kind Error kind.
 * @return Label such as "malformed" or "overflow".
 */
inline const char *to_string(DurationErrorKind kind) {
  switch (kind) {
  case DurationErrorKind::Malformed:
    return "malformed";
  case DurationErrorKind::InvalidNumeral:
    return "invalid numeral";
  case DurationErrorKind::Overflow:
    return "overflow";
  case DurationErrorKind::Internal:
    return "internal";
  }
  return "internal";
}

/**
 * Raised by the lower-level parsing functions. The public
 * parse_duration() entry points never let it escape.
 */
class DurationError : public std::runtime_error {
public:
  DurationError(DurationErrorKind kind, const std::string &message)
      : std::runtime_error(message), kind_(kind) {}

  /// Category of the failure.
  DurationErrorKind kind() const noexcept { return kind_; }

private:
  DurationErrorKind kind_;
};

} // namespace tparse

#endif // TIMEPARSE_DURATION_ERROR_HPP
