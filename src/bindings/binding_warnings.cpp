#include "binding_warnings.hpp"

#include <mutex>
#include <unordered_set>

namespace getchunk::bindings_warn {

namespace {

struct WarningOnceState {
    std::mutex mutex;
    std::unordered_set<std::string> seen;
};

WarningOnceState& warning_once_state() {
    static WarningOnceState state;
    return state;
}

py::object resolve_warning_category(const char* category_name) {
    py::module_ builtins = py::module_::import("builtins");
    if (category_name && category_name[0] != '\0' && py::hasattr(builtins, category_name)) {
        return builtins.attr(category_name);
    }
    return builtins.attr("UserWarning");
}

} // namespace

void warn(const char* message, const char* category_name, int stacklevel) {
    py::module_ warnings = py::module_::import("warnings");
    py::object category = resolve_warning_category(category_name);
    warnings.attr("warn")(py::str(message), category, stacklevel);
}

void warn_once(
    const std::string& key,
    const std::string& message,
    const char* category_name,
    int stacklevel) {
    auto& state = warning_once_state();
    {
        std::lock_guard<std::mutex> lock(state.mutex);
        if (state.seen.find(key) != state.seen.end()) {
            return;
        }
        state.seen.insert(key);
    }

    warn(message.c_str(), category_name, stacklevel);
}

} // namespace getchunk::bindings_warn
