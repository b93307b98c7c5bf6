#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace sp::ignore {

struct GlobToken {
    enum class Kind { Literal, AnyChar, Star, DoubleStar, DirPrefix, Class };

    Kind kind = Kind::Literal;
    char literal = 0;
    std::string set;     // Class members, ranges already expanded
    bool negated = false;
};

struct Pattern {
    std::string source;                              // the line as written, trimmed
    std::string glob;                                // after anchoring / directory rewrites
    unsigned int line = 0;
    std::vector<std::vector<GlobToken>> alternatives; // one per {a,b} expansion

    [[nodiscard]] bool matches(std::string_view path) const;
};

// Compiles the ignore file. Blank lines and '#' comments are skipped.
// Throws error::PatternError (with the 1-based line number) on bad syntax.
std::vector<Pattern> compile(std::string_view text);

// Compiles a single glob; line is only used for error messages.
Pattern compilePattern(std::string_view line, unsigned int lineNo = 0);

[[nodiscard]] bool isIgnored(std::string_view path, const std::vector<Pattern>& patterns);

}
