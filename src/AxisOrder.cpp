#include "AxisOrder.hpp"
#include <cmath>

namespace SCS {

bool isEastingValue(double value) {
    return value >= Limits::MIN_EASTING && value <= Limits::MAX_EASTING;
}

bool isNorthingValue(double value) {
    return value >= Limits::MIN_NORTHING && value <= Limits::MAX_NORTHING;
}

bool isLikelyGeographic(double first, double second) {
    double abs_first = std::abs(first);
    double abs_second = std::abs(second);
    return (abs_first <= 90.0 && abs_second <= 180.0) ||
           (abs_first <= 90.0 && abs_second <= 90.0);
}

std::optional<AxisOrder> resolveAxisOrder(double first, double second) {
    if (isLikelyGeographic(first, second)) return std::nullopt;

    const bool first_e = isEastingValue(first);
    const bool first_n = isNorthingValue(first);
    const bool second_e = isEastingValue(second);
    const bool second_n = isNorthingValue(second);

    // Exactly one reading is possible
    if (first_e && !first_n && second_n && !second_e) {
        return AxisOrder{first, second, std::nullopt};
    }
    if (first_n && !first_e && second_e && !second_n) {
        return AxisOrder{second, first, std::nullopt};
    }

    // One value in range, the other in neither range
    if (first_e && !second_e && !second_n) {
        return AxisOrder{first, second, std::nullopt};
    }
    if (second_e && !first_e && !first_n) {
        return AxisOrder{second, first, std::nullopt};
    }

    // Both readings possible: easting-first, then northing-first. The
    // warning checks the second value in one branch and the first in the other.
    if (first_e && second_n) {
        std::optional<std::string> warning;
        if (second_e) warning = WarningKey::AMBIGUOUS_ORDER;
        return AxisOrder{first, second, warning};
    }
    if (first_n && second_e) {
        std::optional<std::string> warning;
        if (first_e) warning = WarningKey::AMBIGUOUS_ORDER;
        return AxisOrder{second, first, warning};
    }

    return std::nullopt;
}

} // namespace SCS
