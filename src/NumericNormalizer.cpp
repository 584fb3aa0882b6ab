#include "NumericNormalizer.hpp"
#include <cctype>
#include <cmath>
#include <stdexcept>
#include <vector>

namespace SCS {

namespace {

bool isDigit(char c) {
    return std::isdigit(static_cast<unsigned char>(c)) != 0;
}

bool isSeparator(char c) {
    return c == '.' || c == ',';
}

bool allDigits(const std::string& s) {
    if (s.empty()) return false;
    for (char c : s) {
        if (!isDigit(c)) return false;
    }
    return true;
}

int countDigits(const std::string& s) {
    int count = 0;
    for (char c : s) {
        if (isDigit(c)) ++count;
    }
    return count;
}

std::string trim(const std::string& str) {
    size_t first = str.find_first_not_of(' ');
    if (first == std::string::npos) return "";
    size_t last = str.find_last_not_of(' ');
    return str.substr(first, last - first + 1);
}

// Keep digits, separators, signs and spaces. No-break spaces and tabs
// become ordinary spaces; anything else is dropped.
std::string keepNumericCharacters(const std::string& raw) {
    std::string out;
    out.reserve(raw.size());
    for (size_t i = 0; i < raw.size(); ++i) {
        char c = raw[i];
        if (c == '\xC2' && i + 1 < raw.size() && raw[i + 1] == '\xA0') {
            out += ' ';
            ++i;
        } else if (c == '\t' || c == ' ') {
            out += ' ';
        } else if (isDigit(c) || isSeparator(c) || c == '+' || c == '-') {
            out += c;
        }
    }
    return out;
}

std::vector<std::string> splitOnSpaces(const std::string& s) {
    std::vector<std::string> groups;
    std::string current;
    for (char c : s) {
        if (c == ' ') {
            if (!current.empty()) groups.push_back(current);
            current.clear();
        } else {
            current += c;
        }
    }
    if (!current.empty()) groups.push_back(current);
    return groups;
}

// "6 543 210" or "6 543 210,5": first group 1-3 digits, then groups of
// exactly three digits. The last group may carry a decimal tail.
bool isThousandsGrouping(const std::vector<std::string>& groups) {
    if (groups.size() < 2) return false;
    if (groups[0].size() > 3 || !allDigits(groups[0])) return false;

    for (size_t i = 1; i + 1 < groups.size(); ++i) {
        if (groups[i].size() != 3 || !allDigits(groups[i])) return false;
    }

    const std::string& last = groups.back();
    if (last.size() < 3 || !allDigits(last.substr(0, 3))) return false;
    if (last.size() == 3) return true;
    return isSeparator(last[3]) && allDigits(last.substr(4));
}

bool hasSeparatorRun(const std::string& s, size_t run_length) {
    size_t run = 0;
    for (char c : s) {
        run = isSeparator(c) ? run + 1 : 0;
        if (run >= run_length) return true;
    }
    return false;
}

std::string stripSeparators(const std::string& s) {
    std::string out;
    for (char c : s) {
        if (!isSeparator(c)) out += c;
    }
    return out;
}

std::string stripLeadingZeros(const std::string& s) {
    size_t first = s.find_first_not_of('0');
    if (first == std::string::npos) return "0";
    return s.substr(first);
}

std::string stripTrailingZeros(const std::string& s) {
    size_t last = s.find_last_not_of('0');
    if (last == std::string::npos) return "";
    return s.substr(0, last + 1);
}

} // namespace

std::optional<std::string> normalizeNumber(const std::string& raw) {
    if (countDigits(raw) > Limits::MAX_RAW_DIGITS) return std::nullopt;

    std::string cleaned = trim(keepNumericCharacters(raw));
    if (cleaned.empty()) return std::nullopt;

    bool negative = false;
    if (cleaned[0] == '-' || cleaned[0] == '+') {
        negative = cleaned[0] == '-';
        cleaned.erase(0, 1);
    }
    if (cleaned.empty() || cleaned.find_first_of("+-") != std::string::npos) {
        return std::nullopt;
    }

    if (cleaned.find(' ') != std::string::npos) {
        std::vector<std::string> groups = splitOnSpaces(cleaned);
        if (!isThousandsGrouping(groups)) return std::nullopt;
        cleaned.clear();
        for (const auto& group : groups) cleaned += group;
    }

    if (hasSeparatorRun(cleaned, 3)) return std::nullopt;
    if (isSeparator(cleaned.back())) return std::nullopt;

    std::vector<size_t> separators;
    for (size_t i = 0; i < cleaned.size(); ++i) {
        if (isSeparator(cleaned[i])) separators.push_back(i);
    }

    // A leading separator is only a decimal mark when it is the only one
    if (isSeparator(cleaned.front()) && separators.size() != 1) return std::nullopt;

    std::string integer_part;
    std::string fraction_part;

    if (separators.empty()) {
        integer_part = cleaned;
    } else if (separators.size() == 1) {
        integer_part = cleaned.substr(0, separators[0]);
        fraction_part = cleaned.substr(separators[0] + 1);
    } else {
        size_t last = separators.back();
        std::string tail = cleaned.substr(last + 1);

        bool same_glyph = true;
        for (size_t pos : separators) {
            if (cleaned[pos] != cleaned[last]) {
                same_glyph = false;
                break;
            }
        }

        if (same_glyph && tail.size() == 3) {
            integer_part = stripSeparators(cleaned);
        } else {
            integer_part = stripSeparators(cleaned.substr(0, last));
            fraction_part = tail;
        }
    }

    if (!integer_part.empty() && !allDigits(integer_part)) return std::nullopt;
    if (!fraction_part.empty() && !allDigits(fraction_part)) return std::nullopt;

    integer_part = stripLeadingZeros(integer_part);
    fraction_part = stripTrailingZeros(fraction_part);

    if (countDigits(integer_part) + countDigits(fraction_part) > Limits::MAX_SIGNIFICANT_DIGITS) {
        return std::nullopt;
    }

    std::string canonical = integer_part;
    if (!fraction_part.empty()) canonical += "." + fraction_part;

    double value;
    try {
        value = std::stod(canonical);
    } catch (const std::invalid_argument&) {
        return std::nullopt;
    } catch (const std::out_of_range&) {
        return std::nullopt;
    }

    if (!std::isfinite(value) || value > Limits::MAX_ABS_VALUE) return std::nullopt;
    if (value < Limits::PRECISION_LIMITER) return std::string("0");

    return negative ? "-" + canonical : canonical;
}

std::optional<double> parseNumber(const std::string& raw) {
    auto normalized = normalizeNumber(raw);
    if (!normalized) return std::nullopt;

    try {
        return std::stod(*normalized);
    } catch (const std::invalid_argument&) {
        return std::nullopt;
    } catch (const std::out_of_range&) {
        return std::nullopt;
    }
}

} // namespace SCS
