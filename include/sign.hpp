/**
 * @file sign.hpp
 * @brief Leading sign handling for duration expressions.
 */
#ifndef TIMEPARSE_SIGN_HPP
#define TIMEPARSE_SIGN_HPP

#include <string>
#include <string_view>

namespace tparse {

/** \brief Expression split into its sign and the unsigned remainder. */
struct SignedText {
  int sign{1};           ///< +1 or -1.
  std::string remainder; ///< Trimmed text following the sign token.
};

/**
 * Strip surrounding whitespace and an optional leading sign token.
 *
 * '+' and '-' are recognised, as is a lone '|' which counts as positive for
 * compatibility with expressions produced by older tooling. Whitespace between
 * the sign and the expression is skipped.
 *
 * @param input Raw expression text.
 * @return Sign and remainder; the sign defaults to +1.
 * @throws DurationError Malformed when the remainder spans several lines.
 */
SignedText extract_sign(std::string_view input);

/**
 * @brief Remove leading and trailing whitespace.
 */
std::string_view trim(std::string_view text);

} // namespace tparse

#endif // TIMEPARSE_SIGN_HPP
