#include "ProjectionDetector.hpp"
#include <algorithm>
#include <cmath>

namespace SCS {

namespace {

bool isTmLikely(double easting) {
    return easting >= Limits::TM_EASTING_MIN && easting <= Limits::TM_EASTING_MAX;
}

bool isZoneLikely(double easting) {
    return easting >= Limits::ZONE_EASTING_MIN && easting <= Limits::ZONE_EASTING_MAX;
}

DetectionResult chosen(const Projection& projection, double confidence, double easting,
                       std::vector<const Projection*> alternatives) {
    DetectionResult result;
    result.projection = &projection;
    result.confidence = confidence;
    result.alternatives = std::move(alternatives);
    result.warnings = boundaryWarnings(easting, projection);
    return result;
}

} // namespace

std::vector<const Projection*> rankZoneCandidates(double easting, double northing,
                                                  std::optional<double> center_longitude) {
    std::vector<const Projection*> candidates;
    for (const auto& zone : Sweref99::zones()) {
        if (zone.bounds.contains(easting, northing)) candidates.push_back(&zone);
    }

    if (center_longitude && candidates.size() > 1) {
        const double reference = Sweref99::nearestZone(*center_longitude).central_meridian;
        std::stable_sort(candidates.begin(), candidates.end(),
                         [reference](const Projection* a, const Projection* b) {
                             return std::abs(a->central_meridian - reference) <
                                    std::abs(b->central_meridian - reference);
                         });
    }
    return candidates;
}

std::vector<std::string> boundaryWarnings(double easting, const Projection& projection) {
    std::vector<std::string> warnings;
    const ProjectionBounds& b = projection.bounds;
    if (std::abs(easting - b.e_min) <= Limits::WARNING_BUFFER_METERS ||
        std::abs(b.e_max - easting) <= Limits::WARNING_BUFFER_METERS) {
        warnings.push_back(WarningKey::NEAR_BOUNDARY);
    }
    return warnings;
}

DetectionResult detectProjection(double easting, double northing,
                                 std::optional<double> center_longitude,
                                 ProjectionPreference preference) {
    const bool tm_likely = isTmLikely(easting);

    std::vector<const Projection*> zone_candidates;
    if (isZoneLikely(easting)) {
        zone_candidates = rankZoneCandidates(easting, northing, center_longitude);
    }

    if (preference == ProjectionPreference::ZONE && !zone_candidates.empty()) {
        std::vector<const Projection*> rest(zone_candidates.begin() + 1, zone_candidates.end());
        return chosen(*zone_candidates.front(), 1.0, easting, std::move(rest));
    }

    if (preference == ProjectionPreference::TM && tm_likely) {
        return chosen(Sweref99::tm(), 0.9, easting, zone_candidates);
    }

    if (zone_candidates.size() == 1) {
        return chosen(*zone_candidates.front(), 1.0, easting, {});
    }

    if (zone_candidates.size() > 1) {
        const double confidence = center_longitude ? 0.85 : 0.7;
        std::vector<const Projection*> rest(zone_candidates.begin() + 1, zone_candidates.end());
        return chosen(*zone_candidates.front(), confidence, easting, std::move(rest));
    }

    if (tm_likely) {
        return chosen(Sweref99::tm(), 0.6, easting, {});
    }

    DetectionResult none;
    none.warnings.push_back(ErrorKey::NO_PROJECTION);
    return none;
}

} // namespace SCS
