#include "getchunk/core/DebugTrace.hpp"

#include <cstring>

namespace getchunk::debug_trace {

thread_local std::string g_last_sizing;
thread_local std::string g_last_io;
thread_local uint64_t g_read_count = 0;

void set_last_sizing(const char* value) {
    g_last_sizing = value ? value : "";
}

void clear_sizing() {
    g_last_sizing.clear();
}

std::string get_last_sizing() {
    return g_last_sizing;
}

void set_last_io(const char* value) {
    g_last_io = value ? value : "";
    if (value && std::strcmp(value, "io.read") == 0) {
        ++g_read_count;
    }
}

void clear_io() {
    g_last_io.clear();
    g_read_count = 0;
}

std::string get_last_io() {
    return g_last_io;
}

uint64_t get_read_count() {
    return g_read_count;
}

} // namespace getchunk::debug_trace
