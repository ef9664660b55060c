#include "getchunk/core/Config.hpp"

#include <cerrno>
#include <cstring>
#include <iostream>

namespace getchunk {

namespace {

uint64_t read_env_bytes(const char* name) {
    const char* env = std::getenv(name);
    if (!env || *env == '\0') return 0;

    char* end = nullptr;
    errno = 0;
    unsigned long long value = std::strtoull(env, &end, 10);
    if (errno != 0 || end == env || *end != '\0') {
        std::cerr << "[GetChunk] Ignoring " << name << "='" << env
                  << "': expected a byte count" << std::endl;
        return 0;
    }
    return static_cast<uint64_t>(value);
}

bool read_env_flag(const char* name) {
    const char* env = std::getenv(name);
    if (!env || *env == '\0') return false;
    return std::strcmp(env, "0") != 0 && std::strcmp(env, "false") != 0 &&
           std::strcmp(env, "off") != 0;
}

std::atomic<uint64_t>& memory_limit() {
    static std::atomic<uint64_t> limit{read_env_bytes("GETCHUNK_MEMORY_LIMIT")};
    return limit;
}

std::atomic<bool>& include_swap_default() {
    static std::atomic<bool> flag{read_env_flag("GETCHUNK_INCLUDE_SWAP")};
    return flag;
}

std::atomic<bool>& verbose() {
    static std::atomic<bool> flag{read_env_flag("GETCHUNK_VERBOSE")};
    return flag;
}

} // namespace

void set_memory_limit(uint64_t bytes) {
    memory_limit().store(bytes);
}

uint64_t get_memory_limit() {
    return memory_limit().load();
}

void set_include_swap_default(bool enabled) {
    include_swap_default().store(enabled);
}

bool get_include_swap_default() {
    return include_swap_default().load();
}

void set_verbose(bool enabled) {
    verbose().store(enabled);
}

bool is_verbose() {
    return verbose().load();
}

} // namespace getchunk
