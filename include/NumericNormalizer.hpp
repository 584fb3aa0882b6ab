#ifndef NUMERIC_NORMALIZER_HPP
#define NUMERIC_NORMALIZER_HPP

#include "SCS.hpp"
#include <optional>
#include <string>

namespace SCS {

/**
 * @brief Convert a locale-ambiguous number to canonical form
 *
 * Accepts space-grouped thousands ("6 543 210"), either '.' or ',' as
 * the decimal mark and either as grouping. The result uses '.' as the
 * decimal mark, no grouping, an optional leading '-', no leading zeros
 * and no trailing fractional zeros.
 *
 * Rules:
 * - more than 18 raw digits, or more than 15 digits after
 *   normalization, is rejected
 * - a sign is only accepted as the first character
 * - one separator is the decimal mark
 * - several separators: the last one is the decimal mark and the
 *   earlier ones are grouping, unless all separators are the same glyph
 *   and exactly three digits follow the last one, in which case all of
 *   them are grouping ("1.234.567")
 * - three or more consecutive separators, or a trailing separator, is
 *   rejected; a leading separator is only accepted as the sole decimal
 *   mark (".5")
 * - magnitudes below 1e-3 become "0", magnitudes above 1e8 are rejected
 *
 * @return Canonical string, or std::nullopt if the text is malformed
 */
std::optional<std::string> normalizeNumber(const std::string& raw);

/**
 * @brief normalizeNumber() followed by conversion to double
 */
std::optional<double> parseNumber(const std::string& raw);

} // namespace SCS

#endif // NUMERIC_NORMALIZER_HPP
