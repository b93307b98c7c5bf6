#include "storage/StorageEngine.hpp"
#include "error/Error.hpp"

using namespace sp::error;

namespace sp::storage {

std::string normalizePath(const fs::path& relPath) {
    if (relPath.is_absolute() || relPath.has_root_name())
        throw IOError("Path must be relative to the storage root: {}", relPath.string());

    auto out = relPath.lexically_normal().generic_string();
    if (out == ".") return {};
    if (out.starts_with("./")) out.erase(0, 2);
    while (!out.empty() && out.back() == '/') out.pop_back();

    if (out == ".." || out.starts_with("../"))
        throw IOError("Path escapes the storage root: {}", relPath.string());

    return out;
}

}
