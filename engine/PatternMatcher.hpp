#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace fence {

// Classifies a file path against an ordered list of disallowed patterns.
//
// A pattern hits when either
//   - it matches the whole path as a shell-style glob: `*` any run of
//     characters other than '/', `?` one UTF-8 character other than '/',
//     `[...]` a bracket class of ranges (`[^...]` negates), `\` escapes the
//     next character; or
//   - the path contains the pattern as a literal substring.
//
// Iteration stops at the first hit. An empty list never matches.
class PatternMatcher {
public:
    static bool Matches(const std::string& path, const std::vector<std::string>& patterns);

    // Anchored glob match. A malformed pattern (unterminated or empty bracket
    // class, unescaped '-' or ']' inside a class, trailing backslash) never
    // matches.
    static bool GlobMatch(const std::string& pattern, const std::string& text);

private:
    enum class ClassResult { MATCH, NO_MATCH, MALFORMED };

    // Matches `rune` against the bracket class starting at pattern[p] ('[').
    // On success `next` is the index just past the closing ']'.
    static ClassResult MatchClass(const std::string& pattern, size_t p, uint32_t rune, size_t& next);
    static bool IsWellFormed(const std::string& pattern);
};

} // namespace fence
