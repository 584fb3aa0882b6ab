#ifndef SCS_HPP
#define SCS_HPP

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace SCS {

// Forward declarations
struct Projection;
struct ParsedCoordinate;
struct DetectionResult;
struct ValidationResult;
struct MapPoint;
class ProjectionModule;
class ModuleLoadCache;
class CoordinateTransformer;
class CoordinateSearch;
class ConfigReader;

// Enumerations

/**
 * @brief Shape of the coordinate text the user typed
 */
enum class InputFormat {
    SPACE_SEPARATED,     ///< "123456 6543210"
    COMMA_SEPARATED,     ///< "123456,6543210"
    LABELED,             ///< "E=123456 N=6543210"
    UNKNOWN
};

/**
 * @brief Which SWEREF 99 family the detector should favour
 */
enum class ProjectionPreference {
    AUTO,
    TM,
    ZONE
};

enum class ProjectionKind {
    TM,
    ZONE
};

/**
 * @brief Error taxonomy shared by every pipeline stage
 *
 * All stages report opaque string keys; the category groups them so a
 * caller can decide how to present a failure without knowing each key.
 */
enum class ErrorCategory {
    INPUT_ERROR,                 ///< Empty, too long, unparseable, geographic
    RANGE_ERROR,                 ///< Outside global or projection bounds
    PROJECTION_NOT_FOUND_ERROR,  ///< No SWEREF 99 definition matched
    TRANSFORM_ERROR,             ///< Module load timeout/failure, bad result
    STALE_RESULT                 ///< Superseded by a newer search (internal)
};

// Error keys. Mapping them to display text is up to the host UI.
namespace ErrorKey {
    const std::string EMPTY = "coordinateErrorEmpty";
    const std::string TOO_LONG = "coordinateErrorTooLong";
    const std::string PARSE = "coordinateErrorParse";
    const std::string NOT_SWEREF = "coordinateErrorNotSweref";
    const std::string OUT_OF_RANGE = "coordinateErrorOutOfRange";
    const std::string OUT_OF_BOUNDS = "coordinateErrorOutOfBounds";
    const std::string INVALID_NUMBER = "coordinateErrorInvalidNumber";
    const std::string NO_PROJECTION = "coordinateErrorNoProjection";
    const std::string GENERIC = "coordinateErrorGeneric";
    const std::string PROJECTION_TIMEOUT = "coordinateErrorProjectionTimeout";
    const std::string PROJECTION_LOAD = "coordinateErrorProjectionLoad";
    const std::string NO_SPATIAL_REFERENCE = "coordinateErrorNoSpatialReference";
    const std::string INVALID_PROJECTION = "coordinateErrorInvalidProjection";
    const std::string INVALID_COORDINATES = "coordinateErrorInvalidCoordinates";
    const std::string TRANSFORM = "coordinateErrorTransform";
    const std::string SEARCH_OUTDATED = "coordinateSearchOutdated";
}

namespace WarningKey {
    const std::string NEAR_BOUNDARY = "coordinateWarningNearBoundary";
    const std::string AMBIGUOUS_ORDER = "coordinateWarningAmbiguousOrder";
}

/**
 * @brief Fixed limits of the SWEREF 99 search pipeline
 *
 * The boundary buffer and the precision epsilon are preserved as given;
 * they are not derived from the projection parameters.
 */
namespace Limits {
    constexpr std::size_t COORDINATE_INPUT_MAX_LENGTH = 200;
    constexpr std::size_t SEARCH_TERM_MAX_LENGTH = 256;
    constexpr std::size_t MIN_SEARCH_LENGTH = 3;
    constexpr std::size_t MIN_COORDINATE_INPUT_LENGTH = 5;

    constexpr double WARNING_BUFFER_METERS = 5000.0;
    constexpr double PRECISION_LIMITER = 1e-3;
    constexpr double MAX_ABS_VALUE = 1e8;
    constexpr int MAX_RAW_DIGITS = 18;
    constexpr int MAX_SIGNIFICANT_DIGITS = 15;

    // Global SWEREF 99 envelope (also the axis-order ranges)
    constexpr double MIN_EASTING = 30000.0;
    constexpr double MAX_EASTING = 800000.0;
    constexpr double MIN_NORTHING = 5900000.0;
    constexpr double MAX_NORTHING = 7800000.0;

    // Easting windows used to tell TM from the local zones
    constexpr double TM_EASTING_MIN = 300000.0;
    constexpr double TM_EASTING_MAX = 700000.0;
    constexpr double ZONE_EASTING_MIN = 50000.0;
    constexpr double ZONE_EASTING_MAX = 250000.0;

    constexpr std::chrono::milliseconds PROJECTION_LOAD_TIMEOUT{5000};
    constexpr std::chrono::milliseconds LOAD_REGISTRATION_POLL{10};
    constexpr int LOAD_REGISTRATION_ATTEMPTS = 5;
}

// Configuration structures
struct SearchConfig {
    ProjectionPreference preference = ProjectionPreference::AUTO;

    // Host map
    int map_wkid = 3857;                      // Web Mercator
    std::optional<double> center_longitude;   // Degrees, unknown if unset

    // Transform stage
    std::chrono::milliseconds load_timeout = Limits::PROJECTION_LOAD_TIMEOUT;
    int worker_threads = 2;
};

// Enum helpers
std::string toString(InputFormat format);
std::string toString(ProjectionPreference preference);
std::string toString(ErrorCategory category);
std::optional<ProjectionPreference> parsePreference(const std::string& value);

/**
 * @brief Map an error key to its category
 *
 * Unknown keys are treated as input errors.
 */
ErrorCategory errorCategory(const std::string& key);

} // namespace SCS

#endif // SCS_HPP
