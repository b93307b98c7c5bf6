#include "ignore/IgnoreMatcher.hpp"
#include "error/Error.hpp"

#include <functional>

using namespace sp::error;

namespace sp::ignore {

namespace {

using Kind = GlobToken::Kind;

constexpr size_t MAX_EXPANSIONS = 256;

std::string_view trim(std::string_view s) {
    constexpr std::string_view ws = " \t\r\v\f";
    const auto b = s.find_first_not_of(ws);
    if (b == std::string_view::npos) return {};
    const auto e = s.find_last_not_of(ws);
    return s.substr(b, e - b + 1);
}

// Index of the ']' closing the class opened at pos, or npos.
size_t classEnd(const std::string_view s, const size_t pos) {
    size_t i = pos + 1;
    if (i < s.size() && (s[i] == '!' || s[i] == '^')) ++i;
    if (i < s.size() && s[i] == ']') ++i; // leading ']' is a member
    for (; i < s.size(); ++i) {
        if (s[i] == '\\') ++i;
        else if (s[i] == ']') return i;
    }
    return std::string_view::npos;
}

void expandBraces(const std::string& glob, std::vector<std::string>& out, const unsigned int lineNo) {
    size_t open = std::string::npos;
    for (size_t i = 0; i < glob.size(); ++i) {
        if (glob[i] == '\\') ++i;
        else if (glob[i] == '[') {
            const auto end = classEnd(glob, i);
            if (end == std::string_view::npos)
                throw PatternError("Line {}: unterminated character class in '{}'", lineNo, glob);
            i = end;
        } else if (glob[i] == '{') {
            open = i;
            break;
        }
    }

    if (open == std::string::npos) {
        if (out.size() >= MAX_EXPANSIONS)
            throw PatternError("Line {}: too many brace alternatives in '{}'", lineNo, glob);
        out.push_back(glob);
        return;
    }

    std::vector<std::string> alts;
    std::string current;
    int depth = 1;
    size_t close = std::string::npos;

    for (size_t i = open + 1; i < glob.size() && close == std::string::npos; ++i) {
        const char c = glob[i];
        if (c == '\\' && i + 1 < glob.size()) {
            current += c;
            current += glob[++i];
            continue;
        }
        if (c == '[') {
            const auto end = classEnd(glob, i);
            if (end == std::string_view::npos)
                throw PatternError("Line {}: unterminated character class in '{}'", lineNo, glob);
            current.append(glob, i, end - i + 1);
            i = end;
            continue;
        }
        if (c == '{') ++depth;
        else if (c == '}' && --depth == 0) {
            alts.push_back(current);
            close = i;
            continue;
        } else if (c == ',' && depth == 1) {
            alts.push_back(std::move(current));
            current.clear();
            continue;
        }
        current += c;
    }

    if (close == std::string::npos) throw PatternError("Line {}: unterminated '{{' in '{}'", lineNo, glob);

    const auto prefix = glob.substr(0, open);
    const auto suffix = glob.substr(close + 1);
    for (const auto& alt : alts) expandBraces(prefix + alt + suffix, out, lineNo);
}

std::vector<GlobToken> tokenize(const std::string_view glob, const unsigned int lineNo) {
    std::vector<GlobToken> tokens;

    for (size_t i = 0; i < glob.size(); ++i) {
        const char c = glob[i];

        if (c == '\\') {
            if (i + 1 >= glob.size()) throw PatternError("Line {}: dangling '\\' in '{}'", lineNo, glob);
            tokens.push_back({Kind::Literal, glob[++i]});
            continue;
        }

        if (c == '*') {
            size_t run = 1;
            while (i + 1 < glob.size() && glob[i + 1] == '*') { ++i; ++run; }
            if (run == 1) {
                tokens.push_back({Kind::Star});
                continue;
            }
            const bool segmentStart = tokens.empty() || (tokens.back().kind == Kind::Literal && tokens.back().literal == '/');
            if (segmentStart && i + 1 < glob.size() && glob[i + 1] == '/') {
                ++i;
                tokens.push_back({Kind::DirPrefix});
            } else tokens.push_back({Kind::DoubleStar});
            continue;
        }

        if (c == '?') {
            tokens.push_back({Kind::AnyChar});
            continue;
        }

        if (c == '[') {
            const auto end = classEnd(glob, i);
            if (end == std::string_view::npos)
                throw PatternError("Line {}: unterminated character class in '{}'", lineNo, glob);

            GlobToken tok{Kind::Class};
            size_t j = i + 1;
            if (glob[j] == '!' || glob[j] == '^') {
                tok.negated = true;
                ++j;
            }

            while (j < end) {
                char lo = glob[j];
                if (lo == '\\') lo = glob[++j];
                ++j;

                if (j + 1 < end && glob[j] == '-') {
                    char hi = glob[j + 1];
                    j += 2;
                    if (hi == '\\' && j < end) hi = glob[j++];
                    if (hi < lo) throw PatternError("Line {}: invalid range {}-{} in '{}'", lineNo, lo, hi, glob);
                    for (int ch = lo; ch <= hi; ++ch) tok.set += static_cast<char>(ch);
                } else tok.set += lo;
            }

            tokens.push_back(std::move(tok));
            i = end;
            continue;
        }

        tokens.push_back({Kind::Literal, c});
    }

    return tokens;
}

bool matchTokens(const std::vector<GlobToken>& tokens, const std::string_view s) {
    const size_t T = tokens.size(), S = s.size();
    std::vector<signed char> memo((T + 1) * (S + 1), -1);

    const std::function<bool(size_t, size_t)> match = [&](const size_t ti, const size_t si) -> bool {
        auto& slot = memo[ti * (S + 1) + si];
        if (slot >= 0) return slot == 1;

        bool ok = false;
        if (ti == T) ok = si == S;
        else {
            const auto& tok = tokens[ti];
            switch (tok.kind) {
            case Kind::Literal:
                ok = si < S && s[si] == tok.literal && match(ti + 1, si + 1);
                break;
            case Kind::AnyChar:
                ok = si < S && s[si] != '/' && match(ti + 1, si + 1);
                break;
            case Kind::Class:
                ok = si < S && s[si] != '/' &&
                     ((tok.set.find(s[si]) != std::string::npos) != tok.negated) && match(ti + 1, si + 1);
                break;
            case Kind::Star:
                for (size_t k = si; !ok; ++k) {
                    ok = match(ti + 1, k);
                    if (k == S || s[k] == '/') break;
                }
                break;
            case Kind::DoubleStar:
                for (size_t k = si; k <= S && !ok; ++k) ok = match(ti + 1, k);
                break;
            case Kind::DirPrefix:
                // zero or more whole directories
                ok = match(ti + 1, si);
                for (size_t k = si; k < S && !ok; ++k)
                    if (s[k] == '/') ok = match(ti + 1, k + 1);
                break;
            }
        }

        slot = ok ? 1 : 0;
        return ok;
    };

    return match(0, 0);
}

}

bool Pattern::matches(std::string_view path) const {
    if (path.starts_with("./")) path.remove_prefix(2);
    for (const auto& alt : alternatives)
        if (matchTokens(alt, path)) return true;
    return false;
}

Pattern compilePattern(const std::string_view line, const unsigned int lineNo) {
    Pattern p;
    p.source = std::string(trim(line));
    p.line = lineNo;

    std::string_view body = p.source;
    const bool anchored = body.starts_with('/');
    if (anchored) body.remove_prefix(1);

    bool directory = false;
    while (body.ends_with('/') && !body.ends_with("\\/")) {
        body.remove_suffix(1);
        directory = true;
    }

    if (body.empty()) throw PatternError("Line {}: empty pattern '{}'", lineNo, p.source);

    p.glob = std::string(body);
    if (!anchored && p.glob.find('/') == std::string::npos) p.glob = "**/" + p.glob;
    if (directory) p.glob += "/**";

    std::vector<std::string> expanded;
    expandBraces(p.glob, expanded, lineNo);
    for (const auto& g : expanded) p.alternatives.push_back(tokenize(g, lineNo));

    return p;
}

std::vector<Pattern> compile(const std::string_view text) {
    std::vector<Pattern> patterns;
    unsigned int lineNo = 0;
    size_t start = 0;

    while (start <= text.size()) {
        const auto nl = text.find('\n', start);
        const auto end = nl == std::string_view::npos ? text.size() : nl;
        ++lineNo;

        const auto line = trim(text.substr(start, end - start));
        if (!line.empty() && !line.starts_with('#')) patterns.push_back(compilePattern(line, lineNo));

        if (nl == std::string_view::npos) break;
        start = nl + 1;
    }

    return patterns;
}

bool isIgnored(const std::string_view path, const std::vector<Pattern>& patterns) {
    for (const auto& p : patterns)
        if (p.matches(path)) return true;
    return false;
}

}
