#pragma once

#include "ignore/IgnoreMatcher.hpp"

#include <string>
#include <vector>

namespace sp::storage {
class StorageEngine;
}

namespace sp::repo {

// Every file in the tree outside the metadata directory, sorted, ignored ones included.
std::vector<std::string> listWorkingFiles(const storage::StorageEngine& engine);

// Patterns from the ignore file; none when the file is missing.
std::vector<ignore::Pattern> loadIgnorePatterns(const storage::StorageEngine& engine);

// Non-ignored files plus the ignore file itself, sorted.
std::vector<std::string> trackedFiles(const std::vector<std::string>& files,
                                      const std::vector<ignore::Pattern>& patterns);

}
