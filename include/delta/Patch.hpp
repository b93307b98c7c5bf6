#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace sp::delta {

// Splits into lines that keep their terminator; a final unterminated run is its own line.
std::vector<std::string_view> splitLines(std::string_view text);

enum class EditType { Equal, Delete, Insert };

// Above this many differing lines the changed middle section is emitted as
// one delete run followed by one insert run instead of a minimal script.
inline constexpr size_t MAX_EDIT_DISTANCE = 2048;

// Line-level shortest edit script (Myers, O((N+M)D)), one entry per line.
// Common leading and trailing lines are always kept as Equal.
std::vector<EditType> diffLines(const std::vector<std::string_view>& base,
                                const std::vector<std::string_view>& result);

// Serialized edit script turning base into result; empty when they are equal.
//
//   @@ <base lines> <base bytes> <result bytes>\n
//   =<n>\n          copy n base lines
//   -<n>\n          drop n base lines
//   +<len>\n<raw>   emit len raw bytes
std::string makePatch(std::string_view base, std::string_view result);

// Throws error::PatchError when the script is malformed or does not fit base.
std::string applyPatch(std::string_view base, std::string_view patch);

// hex(gzip(patch)); the form stored when compression is on
std::string encodePatch(std::string_view patch, int level);

// Throws error::IntegrityError when the input is not hex-encoded gzip.
std::string decodePatch(std::string_view encoded);

}
