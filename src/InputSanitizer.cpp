#include "InputSanitizer.hpp"
#include <string>

namespace SCS {

namespace {

constexpr char32_t NO_BREAK_SPACE = 0x00A0;

// Decode UTF-8, skipping malformed or overlong sequences byte by byte.
std::u32string decodeUtf8(const std::string& text) {
    std::u32string out;
    out.reserve(text.size());

    size_t i = 0;
    const size_t n = text.size();
    while (i < n) {
        unsigned char lead = static_cast<unsigned char>(text[i]);
        char32_t cp = 0;
        size_t extra = 0;

        if (lead < 0x80) {
            cp = lead;
        } else if ((lead & 0xE0) == 0xC0) {
            cp = lead & 0x1F;
            extra = 1;
        } else if ((lead & 0xF0) == 0xE0) {
            cp = lead & 0x0F;
            extra = 2;
        } else if ((lead & 0xF8) == 0xF0) {
            cp = lead & 0x07;
            extra = 3;
        } else {
            ++i;
            continue;
        }

        bool valid = true;
        for (size_t k = 1; k <= extra; ++k) {
            if (i + k >= n) {
                valid = false;
                break;
            }
            unsigned char cont = static_cast<unsigned char>(text[i + k]);
            if ((cont & 0xC0) != 0x80) {
                valid = false;
                break;
            }
            cp = (cp << 6) | (cont & 0x3F);
        }

        static const char32_t min_for_length[] = {0, 0x80, 0x800, 0x10000};
        if (!valid || cp < min_for_length[extra] || cp > 0x10FFFF ||
            (cp >= 0xD800 && cp <= 0xDFFF)) {
            ++i;
            continue;
        }

        out.push_back(cp);
        i += extra + 1;
    }
    return out;
}

std::string encodeUtf8(const std::u32string& cps) {
    std::string out;
    out.reserve(cps.size());
    for (char32_t cp : cps) {
        if (cp < 0x80) {
            out += static_cast<char>(cp);
        } else if (cp < 0x800) {
            out += static_cast<char>(0xC0 | (cp >> 6));
            out += static_cast<char>(0x80 | (cp & 0x3F));
        } else if (cp < 0x10000) {
            out += static_cast<char>(0xE0 | (cp >> 12));
            out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
            out += static_cast<char>(0x80 | (cp & 0x3F));
        } else {
            out += static_cast<char>(0xF0 | (cp >> 18));
            out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
            out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
            out += static_cast<char>(0x80 | (cp & 0x3F));
        }
    }
    return out;
}

bool isControlWhitespace(char32_t cp) {
    return cp == '\t' || cp == '\n' || cp == '\r' || cp == '\v' || cp == '\f';
}

bool isSpace(char32_t cp) {
    if (cp == ' ' || isControlWhitespace(cp)) return true;
    if (cp == NO_BREAK_SPACE || cp == 0x1680) return true;
    if (cp >= 0x2000 && cp <= 0x200A) return true;
    return cp == 0x2028 || cp == 0x2029 || cp == 0x202F || cp == 0x205F ||
           cp == 0x3000 || cp == 0xFEFF;
}

// '<' up to the next '>' is a tag. A '<' without a closing '>' is kept.
std::u32string stripTags(const std::u32string& in) {
    std::u32string out;
    out.reserve(in.size());
    size_t i = 0;
    while (i < in.size()) {
        if (in[i] == '<') {
            size_t close = in.find(U'>', i + 1);
            if (close != std::u32string::npos) {
                i = close + 1;
                continue;
            }
        }
        out.push_back(in[i]);
        ++i;
    }
    return out;
}

std::u32string collapseWhitespace(const std::u32string& in) {
    std::u32string out;
    out.reserve(in.size());
    bool in_space = false;
    for (char32_t cp : in) {
        if (isSpace(cp)) {
            if (!in_space) out.push_back(U' ');
            in_space = true;
        } else {
            out.push_back(cp);
            in_space = false;
        }
    }
    return out;
}

std::u32string trimSpaces(const std::u32string& in) {
    size_t first = in.find_first_not_of(U' ');
    if (first == std::u32string::npos) return std::u32string();
    size_t last = in.find_last_not_of(U' ');
    return in.substr(first, last - first + 1);
}

std::u32string cleanCoordinateCodePoints(const std::string& raw) {
    std::u32string cps = stripTags(decodeUtf8(raw));

    std::u32string printable;
    printable.reserve(cps.size());
    for (char32_t cp : cps) {
        if (isControlWhitespace(cp)) cp = U' ';
        if ((cp >= 32 && cp <= 126) || (cp >= 160 && cp <= 255)) {
            printable.push_back(cp);
        }
    }

    return trimSpaces(collapseWhitespace(printable));
}

} // namespace

std::string cleanCoordinateText(const std::string& raw) {
    if (raw.empty()) return std::string();
    return encodeUtf8(cleanCoordinateCodePoints(raw));
}

std::string sanitize(const std::string& raw, std::size_t max_length) {
    if (raw.empty()) return std::string();

    std::u32string cleaned = cleanCoordinateCodePoints(raw);
    if (cleaned.size() > max_length) {
        // Cutting can leave a trailing space behind
        cleaned = trimSpaces(cleaned.substr(0, max_length));
    }
    return encodeUtf8(cleaned);
}

std::string sanitizeSearchTerm(const std::string& raw) {
    if (raw.empty()) return std::string();

    std::u32string filtered;
    for (char32_t cp : decodeUtf8(raw)) {
        if (isControlWhitespace(cp)) cp = U' ';
        if (cp < 32 || cp == 127 || cp == '<' || cp == '>') continue;
        filtered.push_back(cp);
    }

    std::u32string cleaned = trimSpaces(collapseWhitespace(filtered));
    if (cleaned.size() > Limits::SEARCH_TERM_MAX_LENGTH) {
        cleaned = trimSpaces(cleaned.substr(0, Limits::SEARCH_TERM_MAX_LENGTH));
    }
    return encodeUtf8(cleaned);
}

bool isSuggestableTerm(const std::string& raw) {
    return codePointLength(sanitizeSearchTerm(raw)) >= Limits::MIN_SEARCH_LENGTH;
}

std::size_t codePointLength(const std::string& text) {
    std::size_t count = 0;
    for (char c : text) {
        if ((static_cast<unsigned char>(c) & 0xC0) != 0x80) ++count;
    }
    return count;
}

} // namespace SCS
