#ifndef COORDINATE_TRANSFORMER_HPP
#define COORDINATE_TRANSFORMER_HPP

#include "SCS.hpp"
#include "CoordinateSystem.hpp"
#include "Projection.hpp"
#include "WorkerPool.hpp"
#include <chrono>
#include <cstdint>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <stdexcept>
#include <string>

namespace SCS {

/**
 * @brief Failure of the transform stage
 *
 * key() is one of the ErrorKey transform keys; what() adds detail for
 * diagnostics.
 */
class TransformError : public std::runtime_error {
public:
    explicit TransformError(const std::string& key, const std::string& detail = "")
        : std::runtime_error(detail.empty() ? key : key + ": " + detail), key_(key) {}

    const std::string& key() const { return key_; }

private:
    std::string key_;
};

/**
 * @brief Memoized loading of projection modules
 *
 * One load per module: concurrent callers share the same in-flight
 * load and the same deadline. A load that times out or fails is
 * evicted so the next caller starts a fresh one.
 *
 * module.load() runs outside the lock. A caller that finds a load
 * marked as starting but not yet registered polls for it (10 ms, up to
 * five times) before starting its own.
 *
 * Entries hold the module weakly and are keyed by its ownership, so a
 * module destroyed while cached never hands its entry to a new module.
 * Entries of destroyed modules are dropped on the next acquire.
 *
 * Modules must return futures that become ready on their own; a
 * deferred future never becomes ready here.
 */
class ModuleLoadCache {
public:
    explicit ModuleLoadCache(std::chrono::milliseconds timeout = Limits::PROJECTION_LOAD_TIMEOUT);

    /**
     * @brief Block until @p module is loaded
     *
     * @throws TransformError coordinateErrorProjectionTimeout if the load
     *         did not finish before its deadline,
     *         coordinateErrorProjectionLoad if it failed
     */
    void ensureLoaded(const std::shared_ptr<ProjectionModule>& module);

    /// Forget the load of @p module, finished or not
    void evict(const std::shared_ptr<ProjectionModule>& module);

    bool isCached(const std::shared_ptr<ProjectionModule>& module) const;

    /// Number of cached loads; those of destroyed modules count until the next acquire
    size_t size() const;

    std::chrono::milliseconds timeout() const { return timeout_; }

private:
    struct Entry {
        std::shared_future<void> future;
        std::chrono::steady_clock::time_point deadline;
        uint64_t generation;
    };

    using ModuleKey = std::weak_ptr<ProjectionModule>;
    using KeyLess = std::owner_less<ModuleKey>;

    Entry acquire(const std::shared_ptr<ProjectionModule>& module);
    void evictIfCurrent(const ModuleKey& key, uint64_t generation);
    void dropExpired();   // Caller holds mutex_

    mutable std::mutex mutex_;
    std::map<ModuleKey, Entry, KeyLess> entries_;
    std::set<ModuleKey, KeyLess> in_progress_;
    uint64_t next_generation_ = 1;
    std::chrono::milliseconds timeout_;
};

/**
 * @brief SWEREF 99 to map transformation
 *
 * A point already in the target reference is returned unchanged
 * without loading the module. Otherwise the module is loaded through
 * the cache and asked to project the point; the result must be finite
 * and is tagged with the target reference if the module left it
 * untagged.
 */
class CoordinateTransformer {
public:
    /**
     * @param module         Projection module, shared with other users
     * @param cache          Load cache; a private one is created if null
     * @param worker_threads Threads serving transform(), started on its
     *                       first call
     */
    explicit CoordinateTransformer(std::shared_ptr<ProjectionModule> module,
                                   std::shared_ptr<ModuleLoadCache> cache = nullptr,
                                   size_t worker_threads = 2);

    CoordinateTransformer(const CoordinateTransformer&) = delete;
    CoordinateTransformer& operator=(const CoordinateTransformer&) = delete;

    /**
     * @brief Transform on a worker thread
     *
     * The future rethrows TransformError on failure.
     */
    std::future<MapPoint> transform(double easting, double northing,
                                    const Projection& projection, int target_wkid);

    /**
     * @brief Transform on the calling thread
     *
     * @throws TransformError
     */
    MapPoint transformNow(double easting, double northing,
                          const Projection& projection, int target_wkid);

    ProjectionModule& module() { return *module_; }
    ModuleLoadCache& loadCache() { return *cache_; }

    /// True once transform() has started the worker threads
    bool workersStarted() const;

private:
    WorkerPool& workers();

    std::shared_ptr<ProjectionModule> module_;
    std::shared_ptr<ModuleLoadCache> cache_;
    size_t worker_threads_;

    mutable std::mutex pool_mutex_;
    std::unique_ptr<WorkerPool> pool_;
};

} // namespace SCS

#endif // COORDINATE_TRANSFORMER_HPP
