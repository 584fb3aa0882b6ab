#include "CoordinateSearch.hpp"
#include <algorithm>
#include <iostream>

namespace SCS {

void appendUnique(std::vector<std::string>& to, const std::vector<std::string>& from) {
    for (const auto& key : from) {
        if (std::find(to.begin(), to.end(), key) == to.end()) {
            to.push_back(key);
        }
    }
}

CoordinateSearch::CoordinateSearch(std::shared_ptr<CoordinateTransformer> transformer,
                                   std::shared_ptr<MapViewContext> map_view,
                                   SearchOptions options,
                                   size_t worker_threads)
    : transformer_(std::move(transformer)),
      map_view_(std::move(map_view)),
      options_(std::move(options)),
      pool_(worker_threads) {
    if (!transformer_) throw std::invalid_argument("CoordinateSearch requires a transformer");
    if (!map_view_) throw std::invalid_argument("CoordinateSearch requires a map view");
}

uint64_t CoordinateSearch::currentSequence() const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return counter_;
}

void CoordinateSearch::checkpoint(uint64_t sequence) const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    if (sequence != counter_) throw StaleSearchError(sequence, counter_);
}

SearchOutcome CoordinateSearch::failure(const std::string& key,
                                        const std::vector<std::string>& warnings) {
    SearchOutcome outcome;
    outcome.status = SearchStatus::FAILED;
    outcome.error = key;
    outcome.warnings = warnings;
    return outcome;
}

SearchOutcome CoordinateSearch::superseded() {
    SearchOutcome outcome;
    outcome.status = SearchStatus::SUPERSEDED;
    outcome.error = ErrorKey::SEARCH_OUTDATED;
    return outcome;
}

std::future<SearchOutcome> CoordinateSearch::searchCoordinates(const std::string& text) {
    uint64_t sequence;
    {
        std::lock_guard<std::recursive_mutex> lock(mutex_);
        sequence = ++counter_;
    }

    auto promise = std::make_shared<std::promise<SearchOutcome>>();
    std::future<SearchOutcome> future = promise->get_future();

    try {
        runStages(sequence, text, promise);
    } catch (const StaleSearchError&) {
        promise->set_value(superseded());
    }
    return future;
}

void CoordinateSearch::runStages(uint64_t sequence, const std::string& text,
                                 const OutcomePromise& promise) {
    PendingTransform pending;

    pending.parsed = parse(text);
    checkpoint(sequence);
    if (!pending.parsed.success) {
        deliver(sequence, failure(pending.parsed.error, {}), *promise);
        return;
    }
    if (pending.parsed.warning) pending.warnings.push_back(*pending.parsed.warning);

    const double easting = pending.parsed.easting;
    const double northing = pending.parsed.northing;

    pending.detection = detectProjection(easting, northing,
                                         usableLongitude(map_view_->centerLongitude()),
                                         options_.preference);
    checkpoint(sequence);
    if (!pending.detection.projection) {
        deliver(sequence, failure(ErrorKey::NO_PROJECTION, pending.warnings), *promise);
        return;
    }
    appendUnique(pending.warnings, pending.detection.warnings);

    ValidationResult validation = validate(easting, northing, pending.detection.projection);
    checkpoint(sequence);
    if (!validation.valid) {
        deliver(sequence, failure(validation.errors.front(), pending.warnings), *promise);
        return;
    }
    appendUnique(pending.warnings, validation.warnings);

    pending.target_wkid = map_view_->spatialReferenceId();

    pool_.enqueue([this, sequence, pending, promise]() {
        try {
            finishTransform(sequence, pending, promise);
        } catch (const StaleSearchError&) {
            promise->set_value(superseded());
        }
    });
}

void CoordinateSearch::finishTransform(uint64_t sequence, const PendingTransform& pending,
                                       const OutcomePromise& promise) {
    SearchOutcome outcome;
    try {
        MapPoint point = transformer_->transformNow(pending.parsed.easting,
                                                    pending.parsed.northing,
                                                    *pending.detection.projection,
                                                    pending.target_wkid);
        SearchResult result;
        result.point = point;
        result.projection = pending.detection.projection;
        result.easting = pending.parsed.easting;
        result.northing = pending.parsed.northing;
        result.format = pending.parsed.format;
        result.confidence = pending.detection.confidence;
        result.alternatives = pending.detection.alternatives;
        result.warnings = pending.warnings;

        outcome.status = SearchStatus::DELIVERED;
        outcome.warnings = pending.warnings;
        outcome.result = std::move(result);
    } catch (const TransformError& e) {
        outcome = failure(e.key(), pending.warnings);
    } catch (const std::exception& e) {
        std::cerr << "Error: Coordinate transform failed: " << e.what() << std::endl;
        outcome = failure(ErrorKey::GENERIC, pending.warnings);
    }

    deliver(sequence, std::move(outcome), *promise);
}

void CoordinateSearch::deliver(uint64_t sequence, SearchOutcome outcome,
                               std::promise<SearchOutcome>& promise) {
    std::exception_ptr callback_error;
    {
        // Nothing may start a new search between this check and the callback
        std::lock_guard<std::recursive_mutex> lock(mutex_);
        if (sequence != counter_) throw StaleSearchError(sequence, counter_);

        try {
            if (outcome.status == SearchStatus::DELIVERED) {
                if (options_.on_success) options_.on_success(*outcome.result);
            } else if (options_.on_error) {
                options_.on_error(outcome.error, outcome.warnings);
            }
        } catch (const std::exception&) {
            callback_error = std::current_exception();
        }
    }

    if (callback_error) {
        promise.set_exception(callback_error);
    } else {
        promise.set_value(std::move(outcome));
    }
}

} // namespace SCS
