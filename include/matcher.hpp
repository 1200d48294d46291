/**
 * @file matcher.hpp
 * @brief Matches an unsigned expression against the grammar table.
 */
#ifndef TIMEPARSE_MATCHER_HPP
#define TIMEPARSE_MATCHER_HPP

#include "field.hpp"
#include "grammar.hpp"

#include <cstddef>
#include <optional>
#include <string_view>

namespace tparse {

/// Longest expression handed to the regex engine.
inline constexpr std::size_t kMaxExpressionLength = 1024;

/** \brief Fields extracted by the first format that matched. */
struct FieldMatch {
  FormatKind kind{FormatKind::Compound};
  FieldMap fields;
};

/**
 * Try each format of time_formats() in order against @p remainder.
 *
 * The first format matching the whole text wins; later formats are not
 * consulted. Blank text never matches.
 *
 * @param remainder Expression with its sign already removed.
 * @return Matched fields, or std::nullopt when no format applies.
 * @throws DurationError Malformed when the text exceeds
 *         kMaxExpressionLength, Internal when a capture has no field.
 */
std::optional<FieldMatch> match_time_format(std::string_view remainder);

} // namespace tparse

#endif // TIMEPARSE_MATCHER_HPP
