#ifndef COORDINATE_PARSER_HPP
#define COORDINATE_PARSER_HPP

#include "SCS.hpp"
#include <optional>
#include <string>
#include <vector>

namespace SCS {

/**
 * @brief Outcome of parsing one coordinate string
 *
 * On success easting/northing/format/sanitized are set; on failure
 * only error (an ErrorKey) is meaningful.
 */
struct ParsedCoordinate {
    bool success = false;
    double easting = 0.0;
    double northing = 0.0;
    InputFormat format = InputFormat::UNKNOWN;
    std::string sanitized;
    std::optional<std::string> warning;
    std::string error;

    static ParsedCoordinate failure(const std::string& error_key);
};

/**
 * @brief Detect the input format
 *
 * Priority: labeled (E/N label followed by an optional ':' or '=' and a
 * number), comma-separated (digit, comma, digit), space-separated
 * (digit, whitespace, digit), otherwise unknown.
 */
InputFormat detectInputFormat(const std::string& sanitized);

/**
 * @brief Extract the raw numeric candidates from sanitized text
 *
 * Tries the signed-number pattern first, then whitespace-separated
 * tokens, then comma-separated parts. The first step that yields at
 * least two candidates wins. Leading/trailing ',' ';' and spaces are
 * stripped from each candidate.
 */
std::vector<std::string> extractNumericCandidates(const std::string& sanitized);

/**
 * @brief Parse free text into a SWEREF 99 easting/northing pair
 *
 * Labeled input assigns axes from the labels (last label wins);
 * otherwise exactly two numbers are extracted and the axis order is
 * resolved from their ranges.
 *
 * Errors: coordinateErrorEmpty, coordinateErrorTooLong,
 * coordinateErrorParse, coordinateErrorNotSweref,
 * coordinateErrorOutOfRange.
 */
ParsedCoordinate parse(const std::string& input);

/**
 * @brief Check an already numeric pair against the global envelope
 *
 * Geographic-looking pairs fail with coordinateErrorNotSweref, pairs
 * outside the envelope with coordinateErrorOutOfRange. The format of a
 * successful result is UNKNOWN.
 */
ParsedCoordinate normalizeCoordinates(double easting, double northing);

// =============================================================================
// Coordinate-likeness classification
// =============================================================================

enum class InputConfidence {
    HIGH,
    MEDIUM,
    LOW
};

enum class ClassificationReason {
    INPUT_TOO_SHORT,
    NOT_TWO_NUMBERS,
    INVALID_NUMBERS,
    ADDRESS_PATTERN_DETECTED,
    UNSUPPORTED_CHARACTERS,
    SWEREF_RANGE,
    WGS84_RANGE,
    OUT_OF_RANGE
};

struct InputClassification {
    bool is_coordinate;
    InputConfidence confidence;
    ClassificationReason reason;
};

/**
 * @brief Guess whether search-box text is a coordinate or a place name
 *
 * Used to route input between coordinate search and geocoding.
 */
InputClassification classifyInput(const std::string& input);

std::string toString(ClassificationReason reason);

} // namespace SCS

#endif // COORDINATE_PARSER_HPP
