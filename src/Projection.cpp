#include "Projection.hpp"
#include <cmath>
#include <iomanip>
#include <limits>
#include <sstream>

namespace SCS {

std::string Projection::projString() const {
    std::ostringstream ss;
    ss << std::setprecision(10)
       << "+proj=tmerc +lat_0=0 +lon_0=" << central_meridian
       << " +k=" << scale_factor
       << " +x_0=" << false_easting
       << " +y_0=" << false_northing
       << " +ellps=GRS80 +towgs84=0,0,0,0,0,0,0 +units=m +no_defs";
    return ss.str();
}

namespace Sweref99 {

namespace {

struct ZoneSpec {
    const char* zone_id;
    int epsg;
    double central_meridian;
};

// Table order is significant: it is the unranked candidate order.
const ZoneSpec ZONE_SPECS[] = {
    {"12 00", 3007, 12.0},
    {"13 30", 3008, 13.5},
    {"15 00", 3009, 15.0},
    {"16 30", 3010, 16.5},
    {"18 00", 3011, 18.0},
    {"14 15", 3012, 14.25},
    {"15 45", 3013, 15.75},
    {"17 15", 3014, 17.25},
    {"18 45", 3015, 18.75},
    {"20 15", 3016, 20.25},
    {"21 45", 3017, 21.75},
    {"23 15", 3018, 23.25},
};

const ProjectionBounds ZONE_BOUNDS{50000.0, 250000.0, 6100000.0, 7700000.0};
const ProjectionBounds TM_BOUNDS{300000.0, 700000.0, 6100000.0, 7700000.0};

std::string zoneIdentifier(const std::string& zone_id) {
    std::string compact;
    for (char c : zone_id) {
        if (c != ' ') compact += c;
    }
    return "sweref99-" + compact;
}

Projection buildZone(const ZoneSpec& spec) {
    Projection p;
    p.id = zoneIdentifier(spec.zone_id);
    p.epsg = spec.epsg;
    p.code = "EPSG:" + std::to_string(spec.epsg);
    p.name = std::string("SWEREF 99 ") + spec.zone_id;
    p.kind = ProjectionKind::ZONE;
    p.zone_id = spec.zone_id;
    p.central_meridian = spec.central_meridian;
    p.scale_factor = 1.0;
    p.false_easting = 150000.0;
    p.false_northing = 0.0;
    p.bounds = ZONE_BOUNDS;
    return p;
}

Projection buildTm() {
    Projection p;
    p.id = "sweref99-tm";
    p.epsg = 3006;
    p.code = "EPSG:3006";
    p.name = "SWEREF 99 TM";
    p.kind = ProjectionKind::TM;
    p.central_meridian = 15.0;
    p.scale_factor = 0.9996;
    p.false_easting = 500000.0;
    p.false_northing = 0.0;
    p.bounds = TM_BOUNDS;
    return p;
}

double roundMeridian(double meridian) {
    return std::round(meridian * 100.0) / 100.0;
}

} // namespace

const Projection& tm() {
    static const Projection instance = buildTm();
    return instance;
}

const std::vector<Projection>& zones() {
    static const std::vector<Projection> table = [] {
        std::vector<Projection> result;
        for (const auto& spec : ZONE_SPECS) {
            result.push_back(buildZone(spec));
        }
        return result;
    }();
    return table;
}

const std::vector<const Projection*>& all() {
    static const std::vector<const Projection*> table = [] {
        std::vector<const Projection*> result;
        result.push_back(&tm());
        for (const auto& zone : zones()) {
            result.push_back(&zone);
        }
        return result;
    }();
    return table;
}

const Projection* findByEpsg(int epsg) {
    for (const Projection* p : all()) {
        if (p->epsg == epsg) return p;
    }
    return nullptr;
}

const Projection* findById(const std::string& id) {
    for (const Projection* p : all()) {
        if (p->id == id) return p;
    }
    return nullptr;
}

const Projection* zoneByMeridian(double meridian) {
    double rounded = roundMeridian(meridian);
    for (const auto& zone : zones()) {
        if (roundMeridian(zone.central_meridian) == rounded) return &zone;
    }
    return nullptr;
}

const Projection& nearestZone(double longitude) {
    const Projection* nearest = &zones().front();
    double min_diff = std::numeric_limits<double>::infinity();
    for (const auto& zone : zones()) {
        double diff = std::abs(zone.central_meridian - longitude);
        if (diff < min_diff) {
            nearest = &zone;
            min_diff = diff;
        }
    }
    return *nearest;
}

} // namespace Sweref99

} // namespace SCS
