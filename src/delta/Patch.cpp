#include "delta/Patch.hpp"
#include "error/Error.hpp"
#include "util/Compressor.hpp"
#include "util/bytes.hpp"
#include "util/hex.hpp"

#include <algorithm>
#include <charconv>
#include <optional>
#include <unordered_map>

using namespace sp::error;

namespace sp::delta {

std::vector<std::string_view> splitLines(const std::string_view text) {
    std::vector<std::string_view> lines;
    size_t start = 0;
    while (start < text.size()) {
        const auto nl = text.find('\n', start);
        const auto end = nl == std::string_view::npos ? text.size() : nl + 1;
        lines.push_back(text.substr(start, end - start));
        start = end;
    }
    return lines;
}

// Lines are interned to ints so the inner loop compares integers.
static std::pair<std::vector<int>, std::vector<int>> internLines(const std::vector<std::string_view>& a,
                                                                 const std::vector<std::string_view>& b) {
    std::unordered_map<std::string_view, int> ids;
    const auto intern = [&](const std::vector<std::string_view>& lines) {
        std::vector<int> out;
        out.reserve(lines.size());
        for (const auto& l : lines) out.push_back(ids.try_emplace(l, static_cast<int>(ids.size())).first->second);
        return out;
    };
    auto ia = intern(a);
    auto ib = intern(b);
    return {std::move(ia), std::move(ib)};
}

// nullopt once the edit distance passes MAX_EDIT_DISTANCE. The saved frontier
// for distance d holds only diagonals -d..d, so memory is O(D^2).
static std::optional<std::vector<EditType>> shortestEdit(const std::vector<int>& a, const std::vector<int>& b) {
    const int n = static_cast<int>(a.size()), m = static_cast<int>(b.size());
    if (n + m == 0) return std::vector<EditType>{};

    const int limit = std::min(n + m, static_cast<int>(MAX_EDIT_DISTANCE));
    const int off = limit + 1;
    std::vector<int> v(2 * limit + 3, 0);
    std::vector<std::vector<int>> trace;

    int found = -1;
    for (int d = 0; d <= limit && found < 0; ++d) {
        trace.emplace_back(v.begin() + off - d, v.begin() + off + d + 1);
        for (int k = -d; k <= d; k += 2) {
            int x = (k == -d || (k != d && v[off + k - 1] < v[off + k + 1])) ? v[off + k + 1] : v[off + k - 1] + 1;
            int y = x - k;
            while (x < n && y < m && a[x] == b[y]) { ++x; ++y; }
            v[off + k] = x;
            if (x >= n && y >= m) {
                found = d;
                break;
            }
        }
    }
    if (found < 0) return std::nullopt;

    // Backtrack from (n, m) through the saved frontiers.
    std::vector<EditType> ops;
    int x = n, y = m;
    for (int d = found; d > 0; --d) {
        const auto& vd = trace[d];
        const auto at = [&](const int k) { return vd[k + d]; };
        const int k = x - y;
        const int prevK = (k == -d || (k != d && at(k - 1) < at(k + 1))) ? k + 1 : k - 1;
        const int prevX = at(prevK);
        const int prevY = prevX - prevK;

        while (x > prevX && y > prevY) {
            ops.push_back(EditType::Equal);
            --x; --y;
        }
        ops.push_back(x == prevX ? EditType::Insert : EditType::Delete);
        x = prevX;
        y = prevY;
    }
    while (x > 0 && y > 0) {
        ops.push_back(EditType::Equal);
        --x; --y;
    }

    std::ranges::reverse(ops);
    return ops;
}

std::vector<EditType> diffLines(const std::vector<std::string_view>& base,
                                const std::vector<std::string_view>& result) {
    size_t prefix = 0;
    while (prefix < base.size() && prefix < result.size() && base[prefix] == result[prefix]) ++prefix;

    size_t suffix = 0;
    while (suffix < base.size() - prefix && suffix < result.size() - prefix &&
           base[base.size() - 1 - suffix] == result[result.size() - 1 - suffix]) ++suffix;

    const std::vector<std::string_view> midA(base.begin() + prefix, base.end() - suffix);
    const std::vector<std::string_view> midB(result.begin() + prefix, result.end() - suffix);
    const auto [ia, ib] = internLines(midA, midB);

    std::vector<EditType> ops(prefix, EditType::Equal);
    if (const auto middle = shortestEdit(ia, ib)) {
        ops.insert(ops.end(), middle->begin(), middle->end());
    } else {
        ops.insert(ops.end(), midA.size(), EditType::Delete);
        ops.insert(ops.end(), midB.size(), EditType::Insert);
    }
    ops.insert(ops.end(), suffix, EditType::Equal);
    return ops;
}

std::string makePatch(const std::string_view base, const std::string_view result) {
    if (base == result) return {};

    const auto a = splitLines(base);
    const auto b = splitLines(result);
    const auto ops = diffLines(a, b);

    std::string out = "@@ " + std::to_string(a.size()) + " " + std::to_string(base.size()) + " " +
                      std::to_string(result.size()) + "\n";

    size_t bi = 0, i = 0;
    while (i < ops.size()) {
        const auto type = ops[i];
        size_t run = 0;
        std::string inserted;
        while (i < ops.size() && ops[i] == type) {
            if (type == EditType::Insert) inserted.append(b[bi]);
            if (type != EditType::Delete) ++bi;
            ++run;
            ++i;
        }

        switch (type) {
        case EditType::Equal:
            out += "=" + std::to_string(run) + "\n";
            break;
        case EditType::Delete:
            out += "-" + std::to_string(run) + "\n";
            break;
        case EditType::Insert:
            out += "+" + std::to_string(inserted.size()) + "\n";
            out += inserted;
            break;
        }
    }

    return out;
}

namespace {

class ScriptReader {
public:
    explicit ScriptReader(const std::string_view script) : script_(script) {}

    [[nodiscard]] bool done() const { return pos_ >= script_.size(); }

    char op() {
        if (done()) throw PatchError("Unexpected end of patch");
        return script_[pos_++];
    }

    size_t number() {
        size_t value = 0;
        const auto* begin = script_.data() + pos_;
        const auto* end = script_.data() + script_.size();
        const auto [ptr, ec] = std::from_chars(begin, end, value);
        if (ec != std::errc{} || ptr == begin) throw PatchError("Expected a number at offset {}", pos_);
        pos_ += static_cast<size_t>(ptr - begin);
        return value;
    }

    void expect(const char c) {
        if (done() || script_[pos_] != c)
            throw PatchError("Expected '{}' at offset {}", c == '\n' ? std::string("\\n") : std::string(1, c), pos_);
        ++pos_;
    }

    void expectLiteral(const std::string_view lit) {
        if (script_.substr(pos_, lit.size()) != lit) throw PatchError("Malformed patch header");
        pos_ += lit.size();
    }

    std::string_view bytes(const size_t len) {
        if (script_.size() - pos_ < len) throw PatchError("Insert of {} bytes runs past the end of the patch", len);
        const auto out = script_.substr(pos_, len);
        pos_ += len;
        return out;
    }

private:
    std::string_view script_;
    size_t pos_ = 0;
};

}

std::string applyPatch(const std::string_view base, const std::string_view patch) {
    if (patch.empty()) return std::string(base);

    ScriptReader in(patch);
    in.expectLiteral("@@ ");
    const auto baseLines = in.number();
    in.expect(' ');
    const auto baseBytes = in.number();
    in.expect(' ');
    const auto resultBytes = in.number();
    in.expect('\n');

    const auto lines = splitLines(base);
    if (lines.size() != baseLines || base.size() != baseBytes)
        throw PatchError("Patch expects a base of {} lines / {} bytes, got {} lines / {} bytes",
                         baseLines, baseBytes, lines.size(), base.size());

    std::string out;
    out.reserve(std::min(resultBytes, base.size() + patch.size()));
    size_t cursor = 0;

    while (!in.done()) {
        const char op = in.op();
        const auto n = in.number();
        in.expect('\n');

        switch (op) {
        case '=':
        case '-':
            if (n > lines.size() - cursor)
                throw PatchError("Patch references base line {} of {}", cursor + n, lines.size());
            if (op == '=')
                for (size_t i = cursor; i < cursor + n; ++i) out.append(lines[i]);
            cursor += n;
            break;
        case '+':
            out.append(in.bytes(n));
            break;
        default:
            throw PatchError("Unknown patch operation '{}'", op);
        }
    }

    if (cursor != lines.size())
        throw PatchError("Patch consumed {} of {} base lines", cursor, lines.size());
    if (out.size() != resultBytes)
        throw PatchError("Patch produced {} bytes, expected {}", out.size(), resultBytes);

    return out;
}

std::string encodePatch(const std::string_view patch, const int level) {
    const util::GzipCompressor gz(level);
    return util::toHex(gz.compress(util::asBytes(patch)));
}

std::string decodePatch(const std::string_view encoded) {
    const auto raw = util::fromHex(encoded);
    if (!raw) throw IntegrityError("Stored patch is not valid hex");

    const auto inflated = util::GzipCompressor().decompress(*raw);
    if (!inflated) throw IntegrityError("Stored patch is not a valid gzip stream");

    return util::toString(*inflated);
}

}
