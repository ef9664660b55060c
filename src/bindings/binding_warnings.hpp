#pragma once

#include "bindings_common.hpp"

#include <string>

namespace getchunk::bindings_warn {

// Emit a warning through Python's warnings module. category_name names a
// builtin warning class ("UserWarning", "RuntimeWarning", ...).
void warn(const char* message, const char* category_name = "UserWarning", int stacklevel = 2);

// Warn-once variant keyed by a stable string.
void warn_once(
    const std::string& key,
    const std::string& message,
    const char* category_name = "UserWarning",
    int stacklevel = 2);

} // namespace getchunk::bindings_warn
