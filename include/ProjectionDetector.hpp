#ifndef PROJECTION_DETECTOR_HPP
#define PROJECTION_DETECTOR_HPP

#include "SCS.hpp"
#include "Projection.hpp"
#include <optional>
#include <string>
#include <vector>

namespace SCS {

/**
 * @brief Best-guess SWEREF 99 projection for an easting/northing pair
 *
 * projection is nullptr when nothing matched; warnings then carries
 * coordinateErrorNoProjection.
 */
struct DetectionResult {
    const Projection* projection = nullptr;
    double confidence = 0.0;                      ///< Heuristic score in [0, 1]
    std::vector<const Projection*> alternatives;
    std::vector<std::string> warnings;
};

/**
 * @brief Zones whose bounds contain the point, most plausible first
 *
 * With a known longitude the zones are ordered by the distance between
 * their central meridian and that of the zone nearest the longitude;
 * equal distances keep table order. Without a longitude the table order
 * is returned.
 */
std::vector<const Projection*> rankZoneCandidates(double easting, double northing,
                                                  std::optional<double> center_longitude);

/**
 * @brief Near-boundary warning for a chosen projection
 *
 * @return WarningKey::NEAR_BOUNDARY if the easting is within 5000 m of
 *         either easting bound, otherwise an empty list
 */
std::vector<std::string> boundaryWarnings(double easting, const Projection& projection);

/**
 * @brief Match a pair against the 13 SWEREF 99 definitions
 *
 * @param center_longitude Host map center, std::nullopt if unknown
 * @param preference       Which family to favour when both could match
 */
DetectionResult detectProjection(double easting, double northing,
                                 std::optional<double> center_longitude,
                                 ProjectionPreference preference);

} // namespace SCS

#endif // PROJECTION_DETECTOR_HPP
