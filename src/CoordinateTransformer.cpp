#include "CoordinateTransformer.hpp"
#include <cmath>
#include <iostream>
#include <thread>

namespace SCS {

// ============================================================================
// ModuleLoadCache Implementation
// ============================================================================

ModuleLoadCache::ModuleLoadCache(std::chrono::milliseconds timeout)
    : timeout_(timeout) {}

void ModuleLoadCache::dropExpired() {
    for (auto it = entries_.begin(); it != entries_.end();) {
        if (it->first.expired()) {
            it = entries_.erase(it);
        } else {
            ++it;
        }
    }
}

ModuleLoadCache::Entry ModuleLoadCache::acquire(const std::shared_ptr<ProjectionModule>& module) {
    const ModuleKey key = module;

    for (int attempt = 0; ; ++attempt) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            dropExpired();
            auto it = entries_.find(key);
            if (it != entries_.end()) return it->second;

            if (in_progress_.count(key) == 0 || attempt >= Limits::LOAD_REGISTRATION_ATTEMPTS) {
                in_progress_.insert(key);
                break;
            }
        }
        // Another caller is between marking the load and registering it
        std::this_thread::sleep_for(Limits::LOAD_REGISTRATION_POLL);
    }

    std::shared_future<void> future;
    try {
        future = module->load();
    } catch (const std::exception& e) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            in_progress_.erase(key);
        }
        std::cerr << "Error: Failed to start loading projection module '"
                  << module->name() << "': " << e.what() << std::endl;
        throw TransformError(ErrorKey::PROJECTION_LOAD, e.what());
    }

    std::lock_guard<std::mutex> lock(mutex_);
    in_progress_.erase(key);

    // A caller that gave up polling may have registered first
    auto it = entries_.find(key);
    if (it != entries_.end()) return it->second;

    Entry entry{future, std::chrono::steady_clock::now() + timeout_, next_generation_++};
    entries_[key] = entry;
    return entry;
}

void ModuleLoadCache::evictIfCurrent(const ModuleKey& key, uint64_t generation) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(key);
    if (it != entries_.end() && it->second.generation == generation) {
        entries_.erase(it);
    }
}

void ModuleLoadCache::ensureLoaded(const std::shared_ptr<ProjectionModule>& module) {
    if (!module) {
        throw TransformError(ErrorKey::PROJECTION_LOAD, "no projection module");
    }
    Entry entry = acquire(module);

    if (!entry.future.valid()) {
        evictIfCurrent(module, entry.generation);
        throw TransformError(ErrorKey::PROJECTION_LOAD, "module returned no load future");
    }

    if (entry.future.wait_until(entry.deadline) != std::future_status::ready) {
        evictIfCurrent(module, entry.generation);
        std::cerr << "Warning: Projection module '" << module->name()
                  << "' did not load within " << timeout_.count() << " ms" << std::endl;
        throw TransformError(ErrorKey::PROJECTION_TIMEOUT);
    }

    try {
        entry.future.get();
    } catch (const std::exception& e) {
        evictIfCurrent(module, entry.generation);
        std::cerr << "Error: Projection module '" << module->name()
                  << "' failed to load: " << e.what() << std::endl;
        throw TransformError(ErrorKey::PROJECTION_LOAD, e.what());
    }
}

void ModuleLoadCache::evict(const std::shared_ptr<ProjectionModule>& module) {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.erase(ModuleKey(module));
}

bool ModuleLoadCache::isCached(const std::shared_ptr<ProjectionModule>& module) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.count(ModuleKey(module)) > 0;
}

size_t ModuleLoadCache::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

// ============================================================================
// CoordinateTransformer Implementation
// ============================================================================

CoordinateTransformer::CoordinateTransformer(std::shared_ptr<ProjectionModule> module,
                                             std::shared_ptr<ModuleLoadCache> cache,
                                             size_t worker_threads)
    : module_(std::move(module)),
      cache_(cache ? std::move(cache) : std::make_shared<ModuleLoadCache>()),
      worker_threads_(worker_threads) {}

WorkerPool& CoordinateTransformer::workers() {
    std::lock_guard<std::mutex> lock(pool_mutex_);
    if (!pool_) pool_.reset(new WorkerPool(worker_threads_));
    return *pool_;
}

bool CoordinateTransformer::workersStarted() const {
    std::lock_guard<std::mutex> lock(pool_mutex_);
    return pool_ != nullptr;
}

std::future<MapPoint> CoordinateTransformer::transform(double easting, double northing,
                                                       const Projection& projection,
                                                       int target_wkid) {
    return workers().submit([this, easting, northing, projection, target_wkid]() {
        return transformNow(easting, northing, projection, target_wkid);
    });
}

MapPoint CoordinateTransformer::transformNow(double easting, double northing,
                                             const Projection& projection, int target_wkid) {
    if (target_wkid <= 0) {
        throw TransformError(ErrorKey::NO_SPATIAL_REFERENCE);
    }
    if (projection.epsg <= 0) {
        throw TransformError(ErrorKey::INVALID_PROJECTION, projection.id);
    }
    if (!std::isfinite(easting) || !std::isfinite(northing)) {
        throw TransformError(ErrorKey::INVALID_COORDINATES);
    }

    MapPoint source(easting, northing, projection.epsg);
    if (source.spatial_reference_id == target_wkid) {
        return source;
    }

    if (!module_) {
        throw TransformError(ErrorKey::PROJECTION_LOAD, "no projection module");
    }
    cache_->ensureLoaded(module_);

    std::optional<MapPoint> result = module_->project(source, target_wkid);
    if (!result || !std::isfinite(result->x) || !std::isfinite(result->y)) {
        throw TransformError(ErrorKey::TRANSFORM,
                             projection.code + " -> EPSG:" + std::to_string(target_wkid));
    }

    if (!result->hasSpatialReference()) {
        result->spatial_reference_id = target_wkid;
    }
    return *result;
}

} // namespace SCS
