#include "SCS.hpp"
#include <algorithm>
#include <cctype>

namespace SCS {

std::string toString(InputFormat format) {
    switch (format) {
        case InputFormat::SPACE_SEPARATED: return "space";
        case InputFormat::COMMA_SEPARATED: return "comma";
        case InputFormat::LABELED:         return "labeled";
        case InputFormat::UNKNOWN:         return "unknown";
    }
    return "unknown";
}

std::string toString(ProjectionPreference preference) {
    switch (preference) {
        case ProjectionPreference::AUTO: return "auto";
        case ProjectionPreference::TM:   return "tm";
        case ProjectionPreference::ZONE: return "zone";
    }
    return "auto";
}

std::string toString(ErrorCategory category) {
    switch (category) {
        case ErrorCategory::INPUT_ERROR:                return "InputError";
        case ErrorCategory::RANGE_ERROR:                return "RangeError";
        case ErrorCategory::PROJECTION_NOT_FOUND_ERROR: return "ProjectionNotFoundError";
        case ErrorCategory::TRANSFORM_ERROR:            return "TransformError";
        case ErrorCategory::STALE_RESULT:               return "StaleResult";
    }
    return "InputError";
}

std::optional<ProjectionPreference> parsePreference(const std::string& value) {
    std::string lower = value;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "auto") return ProjectionPreference::AUTO;
    if (lower == "tm") return ProjectionPreference::TM;
    if (lower == "zone") return ProjectionPreference::ZONE;
    return std::nullopt;
}

ErrorCategory errorCategory(const std::string& key) {
    if (key == ErrorKey::OUT_OF_RANGE || key == ErrorKey::OUT_OF_BOUNDS) {
        return ErrorCategory::RANGE_ERROR;
    }
    if (key == ErrorKey::NO_PROJECTION) {
        return ErrorCategory::PROJECTION_NOT_FOUND_ERROR;
    }
    if (key == ErrorKey::TRANSFORM || key == ErrorKey::PROJECTION_TIMEOUT ||
        key == ErrorKey::PROJECTION_LOAD || key == ErrorKey::NO_SPATIAL_REFERENCE ||
        key == ErrorKey::INVALID_PROJECTION || key == ErrorKey::INVALID_COORDINATES ||
        key == ErrorKey::GENERIC) {
        return ErrorCategory::TRANSFORM_ERROR;
    }
    if (key == ErrorKey::SEARCH_OUTDATED) {
        return ErrorCategory::STALE_RESULT;
    }
    return ErrorCategory::INPUT_ERROR;
}

} // namespace SCS
