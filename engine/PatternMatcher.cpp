#include "engine/PatternMatcher.hpp"

namespace fence {

namespace {

constexpr char kSeparator = '/';
constexpr uint32_t kInvalidRune = 0xFFFD;

// Decodes the UTF-8 sequence starting at text[pos]. A malformed or truncated
// sequence decodes as kInvalidRune with length 1, so scanning always advances.
uint32_t DecodeRune(const std::string& text, size_t pos, size_t& length) {
    const auto lead = static_cast<unsigned char>(text[pos]);
    length = 1;

    size_t continuation = 0;
    uint32_t rune = 0;
    if (lead < 0x80) {
        return lead;
    } else if ((lead & 0xE0) == 0xC0) {
        continuation = 1;
        rune = lead & 0x1F;
    } else if ((lead & 0xF0) == 0xE0) {
        continuation = 2;
        rune = lead & 0x0F;
    } else if ((lead & 0xF8) == 0xF0) {
        continuation = 3;
        rune = lead & 0x07;
    } else {
        return kInvalidRune;
    }

    if (pos + continuation >= text.length()) {
        return kInvalidRune;
    }
    for (size_t i = 1; i <= continuation; ++i) {
        const auto byte = static_cast<unsigned char>(text[pos + i]);
        if ((byte & 0xC0) != 0x80) {
            return kInvalidRune;
        }
        rune = (rune << 6) | (byte & 0x3F);
    }

    length = continuation + 1;
    return rune;
}

// Reads one class character (a rune, or a `\` escape) at pattern[i].
// An unescaped '-' or ']' here is a syntax error.
bool ReadClassChar(const std::string& pattern, size_t& i, uint32_t& rune) {
    if (i >= pattern.length() || pattern[i] == '-' || pattern[i] == ']') {
        return false;
    }
    if (pattern[i] == '\\') {
        ++i;
        if (i >= pattern.length()) {
            return false;
        }
    }

    size_t length = 0;
    rune = DecodeRune(pattern, i, length);
    i += length;
    return true;
}

} // namespace

bool PatternMatcher::Matches(const std::string& path, const std::vector<std::string>& patterns) {
    for (const auto& pattern : patterns) {
        if (GlobMatch(pattern, path) || path.find(pattern) != std::string::npos) {
            return true;
        }
    }
    return false;
}

bool PatternMatcher::GlobMatch(const std::string& pattern, const std::string& text) {
    if (!IsWellFormed(pattern)) {
        return false;
    }

    size_t p = 0; // pattern index
    size_t t = 0; // text index
    size_t star_idx = std::string::npos;
    size_t match_idx = 0;

    while (t < text.length()) {
        if (p < pattern.length()) {
            const char pc = pattern[p];

            if (pc == '*') {
                // remember position for backtracking
                star_idx = p;
                match_idx = t;
                ++p;
                continue;
            }

            if (pc == '?') {
                if (text[t] != kSeparator) {
                    size_t length = 0;
                    DecodeRune(text, t, length);
                    ++p;
                    t += length;
                    continue;
                }
            } else if (pc == '[') {
                size_t length = 0;
                const uint32_t rune = DecodeRune(text, t, length);
                size_t next = p;
                if (MatchClass(pattern, p, rune, next) == ClassResult::MATCH) {
                    p = next;
                    t += length;
                    continue;
                }
            } else if (pc == '\\') {
                if (pattern[p + 1] == text[t]) {
                    p += 2;
                    ++t;
                    continue;
                }
            } else if (pc == text[t]) {
                ++p;
                ++t;
                continue;
            }
        }

        // The last '*' absorbs one more byte, but never a separator. Earlier
        // stars cannot help either: none of them may span a '/'.
        if (star_idx != std::string::npos && text[match_idx] != kSeparator) {
            p = star_idx + 1;
            ++match_idx;
            t = match_idx;
            continue;
        }

        return false;
    }

    // Consume remaining '*' in pattern
    while (p < pattern.length() && pattern[p] == '*') {
        ++p;
    }

    return p == pattern.length();
}

PatternMatcher::ClassResult PatternMatcher::MatchClass(const std::string& pattern, size_t p,
                                                       uint32_t rune, size_t& next) {
    size_t i = p + 1;
    bool negate = false;
    if (i < pattern.length() && pattern[i] == '^') {
        negate = true;
        ++i;
    }

    bool matched = false;
    size_t items = 0;

    while (true) {
        // ']' closes the class once it holds at least one range
        if (i < pattern.length() && pattern[i] == ']' && items > 0) {
            break;
        }

        uint32_t lo = 0;
        if (!ReadClassChar(pattern, i, lo)) {
            return ClassResult::MALFORMED;
        }

        uint32_t hi = lo;
        if (i < pattern.length() && pattern[i] == '-') {
            ++i;
            if (!ReadClassChar(pattern, i, hi)) {
                return ClassResult::MALFORMED;
            }
        }

        if (lo <= rune && rune <= hi) {
            matched = true;
        }
        ++items;
    }

    next = i + 1;
    return matched != negate ? ClassResult::MATCH : ClassResult::NO_MATCH;
}

bool PatternMatcher::IsWellFormed(const std::string& pattern) {
    for (size_t i = 0; i < pattern.length(); ++i) {
        if (pattern[i] == '\\') {
            if (i + 1 >= pattern.length()) {
                return false;
            }
            ++i;
        } else if (pattern[i] == '[') {
            size_t next = i;
            if (MatchClass(pattern, i, 0, next) == ClassResult::MALFORMED) {
                return false;
            }
            i = next - 1;
        }
    }
    return true;
}

} // namespace fence
