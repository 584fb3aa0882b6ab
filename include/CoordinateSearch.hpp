#ifndef COORDINATE_SEARCH_HPP
#define COORDINATE_SEARCH_HPP

#include "SCS.hpp"
#include "BoundsValidator.hpp"
#include "CoordinateParser.hpp"
#include "CoordinateSystem.hpp"
#include "CoordinateTransformer.hpp"
#include "ProjectionDetector.hpp"
#include "WorkerPool.hpp"
#include <cstdint>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace SCS {

/**
 * @brief A successfully searched coordinate
 */
struct SearchResult {
    MapPoint point;                                 ///< In the map's spatial reference
    const Projection* projection = nullptr;         ///< Detected source projection
    double easting = 0.0;                           ///< Source easting
    double northing = 0.0;                          ///< Source northing
    InputFormat format = InputFormat::UNKNOWN;
    double confidence = 0.0;
    std::vector<const Projection*> alternatives;
    std::vector<std::string> warnings;              ///< Distinct, in order of appearance
};

enum class SearchStatus {
    DELIVERED,   ///< on_success was called
    FAILED,      ///< on_error was called
    SUPERSEDED   ///< A newer search started; no callback was called
};

struct SearchOutcome {
    SearchStatus status = SearchStatus::SUPERSEDED;
    std::optional<SearchResult> result;
    std::string error;                      ///< ErrorKey when FAILED or SUPERSEDED
    std::vector<std::string> warnings;
};

struct SearchOptions {
    ProjectionPreference preference = ProjectionPreference::AUTO;
    std::function<void(const SearchResult&)> on_success;
    std::function<void(const std::string& key, const std::vector<std::string>& warnings)> on_error;
};

/**
 * @brief Raised inside a search that a newer search has overtaken
 *
 * Never leaves CoordinateSearch.
 */
class StaleSearchError : public std::runtime_error {
public:
    StaleSearchError(uint64_t sequence, uint64_t current)
        : std::runtime_error(ErrorKey::SEARCH_OUTDATED + ": search " + std::to_string(sequence) +
                             " overtaken by " + std::to_string(current)) {}
};

/**
 * @brief Type-as-you-go coordinate search
 *
 * Every call takes the next sequence number. Parsing, detection and
 * validation run on the calling thread; the transform runs on a worker.
 * The sequence number is compared with the latest one after each stage
 * and, under the same lock that numbers new calls, right before the
 * callback. Only the most recent call ever reaches on_success/on_error;
 * earlier ones resolve as SUPERSEDED.
 *
 * Callbacks run with the sequencing lock held, either on the calling
 * thread (stage failures) or on a worker (transform results). They may
 * start a new search. An exception thrown by a callback is rethrown
 * from the returned future.
 */
class CoordinateSearch {
public:
    CoordinateSearch(std::shared_ptr<CoordinateTransformer> transformer,
                     std::shared_ptr<MapViewContext> map_view,
                     SearchOptions options = SearchOptions(),
                     size_t worker_threads = 2);

    CoordinateSearch(const CoordinateSearch&) = delete;
    CoordinateSearch& operator=(const CoordinateSearch&) = delete;

    /**
     * @brief Search for the coordinate in @p text
     *
     * @return Future resolving once the outcome is known (and delivered,
     *         if still current)
     */
    std::future<SearchOutcome> searchCoordinates(const std::string& text);

    /// Sequence number of the most recent call
    uint64_t currentSequence() const;

    const SearchOptions& options() const { return options_; }

private:
    using OutcomePromise = std::shared_ptr<std::promise<SearchOutcome>>;

    struct PendingTransform {
        ParsedCoordinate parsed;
        DetectionResult detection;
        std::vector<std::string> warnings;
        int target_wkid = 0;
    };

    void checkpoint(uint64_t sequence) const;
    void runStages(uint64_t sequence, const std::string& text, const OutcomePromise& promise);
    void finishTransform(uint64_t sequence, const PendingTransform& pending,
                         const OutcomePromise& promise);
    void deliver(uint64_t sequence, SearchOutcome outcome, std::promise<SearchOutcome>& promise);

    static SearchOutcome failure(const std::string& key, const std::vector<std::string>& warnings);
    static SearchOutcome superseded();

    std::shared_ptr<CoordinateTransformer> transformer_;
    std::shared_ptr<MapViewContext> map_view_;
    SearchOptions options_;

    // Recursive: a callback may start the next search on the same thread
    mutable std::recursive_mutex mutex_;
    uint64_t counter_ = 0;

    WorkerPool pool_;
};

/// Append the keys of @p from that @p to does not hold yet, in order
void appendUnique(std::vector<std::string>& to, const std::vector<std::string>& from);

} // namespace SCS

#endif // COORDINATE_SEARCH_HPP
