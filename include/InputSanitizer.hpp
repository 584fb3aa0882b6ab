#ifndef INPUT_SANITIZER_HPP
#define INPUT_SANITIZER_HPP

#include "SCS.hpp"
#include <string>

namespace SCS {

/**
 * @brief Clean free-text coordinate input
 *
 * Removes markup-like tags, keeps printable Latin-1 code points
 * (32-126, 160-255), collapses whitespace runs to one space, trims and
 * truncates to @p max_length code points. Tab and line breaks count as
 * whitespace. Input is UTF-8; invalid sequences are dropped.
 *
 * Idempotent: sanitize(sanitize(x)) == sanitize(x).
 */
std::string sanitize(const std::string& raw,
                     std::size_t max_length = Limits::COORDINATE_INPUT_MAX_LENGTH);

/**
 * @brief Same cleaning as sanitize() without the length cap
 *
 * The parser uses this so that over-long input can be reported as such
 * instead of being silently cut.
 */
std::string cleanCoordinateText(const std::string& raw);

/**
 * @brief Clean a general search-box term
 *
 * Drops control characters and DEL, collapses whitespace, removes '<'
 * and '>', trims and truncates to 256 code points.
 */
std::string sanitizeSearchTerm(const std::string& raw);

/// True if the sanitized term is long enough to ask for suggestions
bool isSuggestableTerm(const std::string& raw);

/// Number of code points in a UTF-8 string
std::size_t codePointLength(const std::string& text);

} // namespace SCS

#endif // INPUT_SANITIZER_HPP
