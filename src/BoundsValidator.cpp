#include "BoundsValidator.hpp"
#include "AxisOrder.hpp"
#include "ProjectionDetector.hpp"
#include <cmath>

namespace SCS {

bool isSwerefRange(double easting, double northing) {
    return isEastingValue(easting) && isNorthingValue(northing);
}

ValidationResult validate(double easting, double northing, const Projection* projection) {
    ValidationResult result;

    if (!std::isfinite(easting) || !std::isfinite(northing)) {
        result.errors.push_back(ErrorKey::INVALID_NUMBER);
        return result;
    }

    if (projection) {
        if (!projection->bounds.contains(easting, northing)) {
            result.errors.push_back(ErrorKey::OUT_OF_BOUNDS);
            return result;
        }
    } else if (!isSwerefRange(easting, northing)) {
        result.errors.push_back(ErrorKey::OUT_OF_RANGE);
        return result;
    }

    result.valid = true;
    if (projection) {
        result.warnings = boundaryWarnings(easting, *projection);
    }
    return result;
}

} // namespace SCS
