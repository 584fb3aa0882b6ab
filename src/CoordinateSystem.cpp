#include "CoordinateSystem.hpp"
#include <proj.h>
#include <cmath>
#include <iostream>
#include <map>
#include <mutex>
#include <stdexcept>
#include <utility>

namespace SCS {

// ============================================================================
// ProjModule Implementation
// ============================================================================

struct ProjModule::Impl {
    // Serializes every use of ctx and the transform cache; a PJ_CONTEXT
    // must not be used from two threads at once.
    mutable std::mutex mutex;
    PJ_CONTEXT* ctx = nullptr;
    mutable std::map<std::pair<int, int>, PJ*> transforms;
    mutable std::string last_error;

    std::shared_future<void> load_future;
    bool loaded = false;
    bool failed = false;

    ~Impl() {
        // The loader thread uses this object
        if (load_future.valid()) load_future.wait();

        for (auto& entry : transforms) {
            if (entry.second) proj_destroy(entry.second);
        }
        transforms.clear();
        if (ctx) {
            proj_context_destroy(ctx);
            ctx = nullptr;
        }
    }

    void initialize() {
        std::lock_guard<std::mutex> lock(mutex);

        if (!ctx) ctx = proj_context_create();
        if (!ctx) {
            failed = true;
            last_error = "Failed to create PROJ context";
            throw std::runtime_error(last_error);
        }

        PJ* tm = proj_create(ctx, "EPSG:3006");
        if (!tm) {
            int err = proj_context_errno(ctx);
            failed = true;
            last_error = std::string("Failed to resolve EPSG:3006: ") + proj_errno_string(err);
            throw std::runtime_error(last_error);
        }
        proj_destroy(tm);

        loaded = true;
        failed = false;
    }

    // Caller holds mutex
    PJ* transformFor(int source_wkid, int target_wkid) const {
        auto key = std::make_pair(source_wkid, target_wkid);
        auto it = transforms.find(key);
        if (it != transforms.end()) return it->second;

        std::string src = "EPSG:" + std::to_string(source_wkid);
        std::string tgt = "EPSG:" + std::to_string(target_wkid);

        PJ* transform = proj_create_crs_to_crs(ctx, src.c_str(), tgt.c_str(), nullptr);
        if (!transform) {
            int err = proj_context_errno(ctx);
            last_error = "Failed to create transformation " + src + " -> " + tgt + ": " +
                         proj_errno_string(err);
            std::cerr << "Error: " << last_error << std::endl;
            return nullptr;
        }

        // Easting/northing order regardless of the CRS axis definition
        PJ* norm = proj_normalize_for_visualization(ctx, transform);
        if (norm) {
            proj_destroy(transform);
            transform = norm;
        }

        transforms[key] = transform;
        return transform;
    }
};

ProjModule::ProjModule() : impl_(new Impl()) {}

ProjModule::~ProjModule() = default;

std::shared_future<void> ProjModule::load() {
    std::lock_guard<std::mutex> lock(impl_->mutex);

    // Join a running or finished load; retry one that failed
    if (impl_->load_future.valid() && !impl_->failed) {
        return impl_->load_future;
    }

    impl_->failed = false;
    Impl* impl = impl_.get();
    impl_->load_future = std::async(std::launch::async, [impl]() {
        impl->initialize();
    }).share();
    return impl_->load_future;
}

std::optional<MapPoint> ProjModule::project(const MapPoint& point, int target_wkid) const {
    std::lock_guard<std::mutex> lock(impl_->mutex);

    if (!impl_->loaded || !impl_->ctx) {
        impl_->last_error = "PROJ module not loaded";
        return std::nullopt;
    }
    if (!point.hasSpatialReference()) {
        impl_->last_error = "Source point has no spatial reference";
        return std::nullopt;
    }

    PJ* transform = impl_->transformFor(point.spatial_reference_id, target_wkid);
    if (!transform) return std::nullopt;

    PJ_COORD in = proj_coord(point.x, point.y, 0, 0);
    PJ_COORD out = proj_trans(transform, PJ_FWD, in);

    int err = proj_errno(transform);
    if (err) {
        impl_->last_error = proj_errno_string(err);
        proj_errno_reset(transform);
        return std::nullopt;
    }

    return MapPoint(out.xy.x, out.xy.y, target_wkid);
}

bool ProjModule::isLoaded() const {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    return impl_->loaded;
}

std::string ProjModule::getLastError() const {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    return impl_->last_error;
}

// ============================================================================
// Map view helpers
// ============================================================================

std::optional<double> usableLongitude(std::optional<double> longitude) {
    if (!longitude || !std::isfinite(*longitude)) return std::nullopt;
    if (*longitude < -180.0 || *longitude > 180.0) return std::nullopt;
    return longitude;
}

} // namespace SCS
