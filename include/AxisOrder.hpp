#ifndef AXIS_ORDER_HPP
#define AXIS_ORDER_HPP

#include "SCS.hpp"
#include <optional>
#include <string>

namespace SCS {

/**
 * @brief Easting/northing assignment of two parsed numbers
 */
struct AxisOrder {
    double easting;
    double northing;
    std::optional<std::string> warning;   ///< WarningKey::AMBIGUOUS_ORDER
};

/// Easting within the global SWEREF 99 range [30000, 800000]
bool isEastingValue(double value);

/// Northing within the global SWEREF 99 range [5900000, 7800000]
bool isNorthingValue(double value);

/**
 * @brief True if the pair looks like latitude/longitude degrees
 *
 * |first| <= 90 and |second| <= 180, or both within 90.
 */
bool isLikelyGeographic(double first, double second);

/**
 * @brief Decide which of two numbers is the easting
 *
 * Geographic-looking pairs are rejected first. Unambiguous readings win
 * next; a value in range paired with a value in neither range keeps its
 * axis. Only when both readings are possible is a default applied, with
 * the ambiguity warning attached if the alternate reading is also
 * range-valid.
 *
 * @return std::nullopt if the pair is geographic or the order cannot be
 *         determined
 */
std::optional<AxisOrder> resolveAxisOrder(double first, double second);

} // namespace SCS

#endif // AXIS_ORDER_HPP
