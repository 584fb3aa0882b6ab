#ifndef COORDINATE_SYSTEM_HPP
#define COORDINATE_SYSTEM_HPP

#include <future>
#include <memory>
#include <optional>
#include <string>

namespace SCS {

/**
 * @brief Planar point tagged with its spatial reference
 */
struct MapPoint {
    double x;                   ///< Easting / map X
    double y;                   ///< Northing / map Y
    int spatial_reference_id;   ///< EPSG/WKID, 0 if untagged

    MapPoint() : x(0), y(0), spatial_reference_id(0) {}
    MapPoint(double xx, double yy, int wkid = 0) : x(xx), y(yy), spatial_reference_id(wkid) {}

    bool hasSpatialReference() const { return spatial_reference_id != 0; }
};

/**
 * @brief Projection-computation module
 *
 * load() prepares whatever the module needs (databases, grids) and may
 * take a while; project() is synchronous and only valid after a
 * successful load. Implementations must allow project() from several
 * threads.
 */
class ProjectionModule {
public:
    virtual ~ProjectionModule() = default;

    /**
     * @brief Start (or join) loading the module
     *
     * The future becomes ready when loading finished; a failed load
     * stores its exception in the future.
     */
    virtual std::shared_future<void> load() = 0;

    /**
     * @brief Project a point to another spatial reference
     *
     * @return Projected point, std::nullopt if the projection failed
     */
    virtual std::optional<MapPoint> project(const MapPoint& point, int target_wkid) const = 0;

    virtual std::string name() const = 0;
};

/**
 * @brief ProjectionModule backed by the PROJ library
 *
 * Loading creates the PROJ context and checks that the EPSG database
 * resolves SWEREF 99 TM. Transformations are created on first use for
 * each (source, target) pair and cached; results use the
 * easting/northing (x/y) axis order.
 *
 * Usage:
 * @code
 * ProjModule proj;
 * proj.load().get();
 * auto web = proj.project(MapPoint(500000, 6500000, 3006), 3857);
 * @endcode
 */
class ProjModule : public ProjectionModule {
public:
    ProjModule();
    ~ProjModule() override;

    // PROJ handles are not copyable
    ProjModule(const ProjModule&) = delete;
    ProjModule& operator=(const ProjModule&) = delete;

    std::shared_future<void> load() override;
    std::optional<MapPoint> project(const MapPoint& point, int target_wkid) const override;
    std::string name() const override { return "PROJ"; }

    bool isLoaded() const;

    /// Last PROJ error message, empty if none
    std::string getLastError() const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

/**
 * @brief Read access to the host map
 */
class MapViewContext {
public:
    virtual ~MapViewContext() = default;

    /// Longitude of the map center in degrees, std::nullopt if unknown
    virtual std::optional<double> centerLongitude() const = 0;

    /// Spatial reference the map displays (target of the transform)
    virtual int spatialReferenceId() const = 0;
};

/**
 * @brief Fixed map view for the command line and tests
 *
 * Not synchronized: change it only while no search is being started.
 */
class StaticMapView : public MapViewContext {
public:
    explicit StaticMapView(int wkid, std::optional<double> center_longitude = std::nullopt)
        : wkid_(wkid), center_longitude_(center_longitude) {}

    std::optional<double> centerLongitude() const override { return center_longitude_; }
    int spatialReferenceId() const override { return wkid_; }

    void setCenterLongitude(std::optional<double> longitude) { center_longitude_ = longitude; }
    void setSpatialReferenceId(int wkid) { wkid_ = wkid; }

private:
    int wkid_;
    std::optional<double> center_longitude_;
};

/**
 * @brief Longitude usable for zone ranking
 *
 * Non-finite values and values outside [-180, 180] count as unknown.
 */
std::optional<double> usableLongitude(std::optional<double> longitude);

} // namespace SCS

#endif // COORDINATE_SYSTEM_HPP
