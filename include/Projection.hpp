#ifndef PROJECTION_HPP
#define PROJECTION_HPP

#include "SCS.hpp"
#include <string>
#include <vector>

namespace SCS {

/**
 * @brief Rectangular easting/northing envelope in projected meters
 */
struct ProjectionBounds {
    double e_min;
    double e_max;
    double n_min;
    double n_max;

    bool containsEasting(double easting) const { return easting >= e_min && easting <= e_max; }
    bool containsNorthing(double northing) const { return northing >= n_min && northing <= n_max; }
    bool contains(double easting, double northing) const {
        return containsEasting(easting) && containsNorthing(northing);
    }
};

/**
 * @brief One SWEREF 99 projected coordinate reference system
 *
 * Instances live in a process-wide immutable table; the rest of the
 * library refers to them by pointer.
 */
struct Projection {
    std::string id;             ///< e.g. "sweref99-tm", "sweref99-1330"
    int epsg;                   ///< EPSG code (3006..3018)
    std::string code;           ///< "EPSG:<epsg>"
    std::string name;           ///< e.g. "SWEREF 99 13 30"
    ProjectionKind kind;
    std::string zone_id;        ///< e.g. "13 30", empty for TM
    double central_meridian;    ///< Degrees east
    double scale_factor;
    double false_easting;
    double false_northing;
    ProjectionBounds bounds;

    bool isZone() const { return kind == ProjectionKind::ZONE; }

    /**
     * @brief PROJ definition string (GRS80, transverse Mercator)
     */
    std::string projString() const;
};

/**
 * @brief The fixed SWEREF 99 projection table
 *
 * One national TM projection and twelve local zones. All zones share a
 * single bounds envelope and differ only by central meridian.
 */
namespace Sweref99 {

    const Projection& tm();

    /// Zones in table order (EPSG 3007..3018)
    const std::vector<Projection>& zones();

    /// TM first, then the zones in table order
    const std::vector<const Projection*>& all();

    const Projection* findByEpsg(int epsg);
    const Projection* findById(const std::string& id);

    /**
     * @brief Zone whose central meridian equals @p meridian
     *
     * The lookup rounds to two decimals, so 13.5 and 13.499 both find
     * SWEREF 99 13 30. Returns nullptr if no zone matches.
     */
    const Projection* zoneByMeridian(double meridian);

    /**
     * @brief Zone with the central meridian closest to @p longitude
     *
     * Ties resolve to the zone that comes first in table order.
     */
    const Projection& nearestZone(double longitude);

} // namespace Sweref99

} // namespace SCS

#endif // PROJECTION_HPP
