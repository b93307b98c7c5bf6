#include "error/Error.hpp"

namespace sp::error {

std::string_view to_string(const Kind kind) {
    switch (kind) {
        case Kind::NotInitialized: return "not_initialized";
        case Kind::AlreadyInitialized: return "already_initialized";
        case Kind::NotFound: return "not_found";
        case Kind::NoFilesToSave: return "no_files_to_save";
        case Kind::Integrity: return "integrity_error";
        case Kind::Patch: return "patch_error";
        case Kind::IO: return "io_error";
        case Kind::Pattern: return "pattern_error";
        case Kind::Config: return "config_error";
    }
    return "unknown";
}

}
