#pragma once

#include <stdexcept>
#include <string>
#include <system_error>

namespace getchunk {

/**
 * @brief Raised when a source or cursor is configured with values it cannot honor.
 *
 * Reported at construction/configuration time, never deferred to a later read.
 */
class ConfigurationError : public std::invalid_argument {
public:
    explicit ConfigurationError(const std::string& message)
        : std::invalid_argument(message) {}
};

/**
 * @brief Failure of the underlying byte source (read or seek).
 *
 * Carries the errno reported by the OS, or EIO when the source only knows
 * that the data is gone (e.g. a file that shrank under the cursor).
 */
class IoError : public std::system_error {
public:
    IoError(int error_number, const std::string& message)
        : std::system_error(error_number, std::generic_category(), message) {}

    int error_number() const { return code().value(); }
};

} // namespace getchunk
