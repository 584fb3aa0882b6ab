#ifndef BOUNDS_VALIDATOR_HPP
#define BOUNDS_VALIDATOR_HPP

#include "SCS.hpp"
#include "Projection.hpp"
#include <string>
#include <vector>

namespace SCS {

struct ValidationResult {
    bool valid = false;
    std::vector<std::string> errors;
    std::vector<std::string> warnings;
};

/// Pair lies inside the global SWEREF 99 envelope
bool isSwerefRange(double easting, double northing);

/**
 * @brief Re-check a pair against its projection or the global envelope
 *
 * Non-finite values fail with coordinateErrorInvalidNumber. With a
 * projection both values must lie in its bounds
 * (coordinateErrorOutOfBounds); without one they must lie in the global
 * envelope (coordinateErrorOutOfRange). A valid pair near the easting
 * bounds of its projection carries coordinateWarningNearBoundary.
 */
ValidationResult validate(double easting, double northing, const Projection* projection);

} // namespace SCS

#endif // BOUNDS_VALIDATOR_HPP
