#include "CoordinateParser.hpp"
#include "AxisOrder.hpp"
#include "InputSanitizer.hpp"
#include "NumericNormalizer.hpp"
#include <cctype>
#include <cmath>
#include <regex>

namespace SCS {

namespace {

const std::regex& labeledPattern() {
    static const std::regex pattern(R"(([ENen])\s*[:=]?\s*([-+]?\d[\d\s.,]*))");
    return pattern;
}

const std::regex& numberPattern() {
    static const std::regex pattern(R"([-+]?\d[\d\s.,]*)");
    return pattern;
}

const std::regex& commaPattern() {
    static const std::regex pattern(R"(\d\s*,\s*\d)");
    return pattern;
}

const std::regex& spacePattern() {
    static const std::regex pattern(R"(\d\s+\d)");
    return pattern;
}

bool isDelimiter(char c) {
    return c == ' ' || c == ',' || c == ';';
}

std::string trimDelimiters(const std::string& token) {
    size_t first = 0;
    while (first < token.size() && isDelimiter(token[first])) ++first;
    size_t last = token.size();
    while (last > first && isDelimiter(token[last - 1])) --last;
    return token.substr(first, last - first);
}

std::vector<std::string> splitOn(const std::string& text, char delimiter) {
    std::vector<std::string> parts;
    std::string current;
    for (char c : text) {
        if (c == delimiter) {
            std::string part = trimDelimiters(current);
            if (!part.empty()) parts.push_back(part);
            current.clear();
        } else {
            current += c;
        }
    }
    std::string part = trimDelimiters(current);
    if (!part.empty()) parts.push_back(part);
    return parts;
}

struct LabeledValues {
    std::optional<double> easting;
    std::optional<double> northing;
};

// Later labels override earlier ones; values that fail to normalize are skipped
LabeledValues parseLabeled(const std::string& sanitized) {
    LabeledValues values;
    auto begin = std::sregex_iterator(sanitized.begin(), sanitized.end(), labeledPattern());
    for (auto it = begin; it != std::sregex_iterator(); ++it) {
        const std::smatch& match = *it;
        auto value = parseNumber(trimDelimiters(match[2].str()));
        if (!value) continue;

        char label = static_cast<char>(std::toupper(static_cast<unsigned char>(match[1].str()[0])));
        if (label == 'E') {
            values.easting = value;
        } else {
            values.northing = value;
        }
    }
    return values;
}

bool inGlobalEnvelope(double easting, double northing) {
    return isEastingValue(easting) && isNorthingValue(northing);
}

ParsedCoordinate buildResult(double easting, double northing, InputFormat format,
                             const std::string& sanitized,
                             const std::optional<std::string>& warning) {
    if (isLikelyGeographic(easting, northing)) {
        return ParsedCoordinate::failure(ErrorKey::NOT_SWEREF);
    }
    if (!inGlobalEnvelope(easting, northing)) {
        return ParsedCoordinate::failure(ErrorKey::OUT_OF_RANGE);
    }

    ParsedCoordinate result;
    result.success = true;
    result.easting = easting;
    result.northing = northing;
    result.format = format;
    result.sanitized = sanitized;
    result.warning = warning;
    return result;
}

// Lowercase ASCII and fold the Swedish letters used by the address
// patterns (å ä ö é, both cases) to their base letter.
std::string foldForAddressMatch(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    for (size_t i = 0; i < text.size(); ++i) {
        unsigned char c = static_cast<unsigned char>(text[i]);
        if (c == 0xC3 && i + 1 < text.size()) {
            unsigned char next = static_cast<unsigned char>(text[i + 1]);
            switch (next) {
                case 0xA5: case 0xA4: case 0x85: case 0x84:
                    out += 'a'; ++i; continue;
                case 0xB6: case 0x96:
                    out += 'o'; ++i; continue;
                case 0xA9: case 0x89:
                    out += 'e'; ++i; continue;
                default:
                    break;
            }
        }
        out += static_cast<char>(std::tolower(c));
    }
    return out;
}

bool looksLikeAddress(const std::string& sanitized) {
    static const std::regex street(R"(\b(gata|gatan|vag|vagen|plan|torg|torget|alle|allen)\b)");
    static const std::regex postal(R"(\b\d{3}\s?\d{2}\b)");
    static const std::regex city(R"(\b(stockholm|goteborg|malmo|uppsala|linkoping)\b)");

    std::string folded = foldForAddressMatch(sanitized);
    return std::regex_search(folded, street) ||
           std::regex_search(folded, postal) ||
           std::regex_search(folded, city);
}

// Letters other than the axis labels E/N mark the text as a place name
bool hasUnsupportedLetters(const std::string& sanitized) {
    for (unsigned char c : sanitized) {
        if (c >= 0x80) return true;
        if (std::isalpha(c)) {
            char upper = static_cast<char>(std::toupper(c));
            if (upper != 'E' && upper != 'N') return true;
        }
    }
    return false;
}

} // namespace

ParsedCoordinate ParsedCoordinate::failure(const std::string& error_key) {
    ParsedCoordinate result;
    result.success = false;
    result.error = error_key;
    return result;
}

InputFormat detectInputFormat(const std::string& sanitized) {
    if (std::regex_search(sanitized, labeledPattern())) return InputFormat::LABELED;
    if (std::regex_search(sanitized, commaPattern())) return InputFormat::COMMA_SEPARATED;
    if (std::regex_search(sanitized, spacePattern())) return InputFormat::SPACE_SEPARATED;
    return InputFormat::UNKNOWN;
}

std::vector<std::string> extractNumericCandidates(const std::string& sanitized) {
    std::vector<std::string> numbers;
    auto begin = std::sregex_iterator(sanitized.begin(), sanitized.end(), numberPattern());
    for (auto it = begin; it != std::sregex_iterator(); ++it) {
        std::string token = trimDelimiters(it->str());
        if (!token.empty()) numbers.push_back(token);
    }
    if (numbers.size() >= 2) return numbers;

    // "500000 6500000" is one greedy match; fall back to whitespace tokens
    std::vector<std::string> tokens = splitOn(sanitized, ' ');
    if (tokens.size() >= 2) return tokens;

    // "500000,6500000"
    if (std::regex_search(sanitized, commaPattern())) {
        std::vector<std::string> parts = splitOn(sanitized, ',');
        if (parts.size() >= 2) return parts;
    }

    return numbers;
}

ParsedCoordinate parse(const std::string& input) {
    if (input.empty()) return ParsedCoordinate::failure(ErrorKey::EMPTY);

    std::string sanitized = cleanCoordinateText(input);
    if (sanitized.empty()) return ParsedCoordinate::failure(ErrorKey::EMPTY);
    if (codePointLength(sanitized) > Limits::COORDINATE_INPUT_MAX_LENGTH) {
        return ParsedCoordinate::failure(ErrorKey::TOO_LONG);
    }

    InputFormat format = detectInputFormat(sanitized);

    if (format == InputFormat::LABELED) {
        LabeledValues labeled = parseLabeled(sanitized);
        if (labeled.easting && labeled.northing) {
            return buildResult(*labeled.easting, *labeled.northing, InputFormat::LABELED,
                               sanitized, std::nullopt);
        }
    }

    std::vector<std::string> candidates = extractNumericCandidates(sanitized);
    if (candidates.size() != 2) return ParsedCoordinate::failure(ErrorKey::PARSE);

    auto first = parseNumber(candidates[0]);
    auto second = parseNumber(candidates[1]);
    if (!first || !second) return ParsedCoordinate::failure(ErrorKey::PARSE);

    if (isLikelyGeographic(*first, *second)) {
        return ParsedCoordinate::failure(ErrorKey::NOT_SWEREF);
    }

    auto order = resolveAxisOrder(*first, *second);
    if (!order) return ParsedCoordinate::failure(ErrorKey::PARSE);

    // Axis order came from the values, not from labels
    InputFormat resolved = format;
    if (resolved == InputFormat::UNKNOWN || resolved == InputFormat::LABELED) {
        resolved = sanitized.find(',') != std::string::npos ? InputFormat::COMMA_SEPARATED
                                                            : InputFormat::SPACE_SEPARATED;
    }

    return buildResult(order->easting, order->northing, resolved, sanitized, order->warning);
}

ParsedCoordinate normalizeCoordinates(double easting, double northing) {
    if (!std::isfinite(easting) || !std::isfinite(northing)) {
        return ParsedCoordinate::failure(ErrorKey::INVALID_NUMBER);
    }
    return buildResult(easting, northing, InputFormat::UNKNOWN, "", std::nullopt);
}

InputClassification classifyInput(const std::string& input) {
    std::string sanitized = sanitize(input);

    if (codePointLength(sanitized) < Limits::MIN_COORDINATE_INPUT_LENGTH) {
        return {false, InputConfidence::HIGH, ClassificationReason::INPUT_TOO_SHORT};
    }

    if (hasUnsupportedLetters(sanitized)) {
        return {false, InputConfidence::HIGH, ClassificationReason::UNSUPPORTED_CHARACTERS};
    }

    std::vector<std::string> candidates = extractNumericCandidates(sanitized);
    if (candidates.size() != 2) {
        InputConfidence confidence = candidates.size() > 2 ? InputConfidence::MEDIUM
                                                           : InputConfidence::HIGH;
        return {false, confidence, ClassificationReason::NOT_TWO_NUMBERS};
    }

    auto first = parseNumber(candidates[0]);
    auto second = parseNumber(candidates[1]);
    if (!first || !second) {
        return {false, InputConfidence::HIGH, ClassificationReason::INVALID_NUMBERS};
    }

    if (looksLikeAddress(sanitized)) {
        return {false, InputConfidence::HIGH, ClassificationReason::ADDRESS_PATTERN_DETECTED};
    }

    if (auto order = resolveAxisOrder(*first, *second)) {
        InputConfidence confidence = order->warning ? InputConfidence::MEDIUM
                                                    : InputConfidence::HIGH;
        return {true, confidence, ClassificationReason::SWEREF_RANGE};
    }

    if (isLikelyGeographic(*first, *second)) {
        return {true, InputConfidence::MEDIUM, ClassificationReason::WGS84_RANGE};
    }

    return {false, InputConfidence::HIGH, ClassificationReason::OUT_OF_RANGE};
}

std::string toString(ClassificationReason reason) {
    switch (reason) {
        case ClassificationReason::INPUT_TOO_SHORT: return "input_too_short";
        case ClassificationReason::NOT_TWO_NUMBERS: return "not_two_numbers";
        case ClassificationReason::INVALID_NUMBERS: return "invalid_numbers";
        case ClassificationReason::ADDRESS_PATTERN_DETECTED: return "address_pattern_detected";
        case ClassificationReason::UNSUPPORTED_CHARACTERS: return "unsupported_characters";
        case ClassificationReason::SWEREF_RANGE: return "sweref_range";
        case ClassificationReason::WGS84_RANGE: return "wgs84_range";
        case ClassificationReason::OUT_OF_RANGE: return "out_of_range";
    }
    return "unknown";
}

} // namespace SCS
