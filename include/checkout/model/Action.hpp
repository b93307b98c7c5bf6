#pragma once

#include <cstddef>
#include <string>

namespace sp::checkout::model {

enum class ActionType {
    Preserve,   // snapshot an ignored file before anything changes
    Delete,     // tracked-looking file the target save does not have
    Write,      // materialize a manifest path from the target save
};

struct Action {
    ActionType type{ActionType::Write};
    std::string path;
};

struct Summary {
    std::string save_id;
    bool ignore_file_restored = false;
    size_t written = 0;
    size_t deleted = 0;
    size_t preserved = 0;
};

}
