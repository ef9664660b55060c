#pragma once

#include <cstdint>
#include <string>

namespace getchunk::debug_trace {

// Test-only hook recording which sizing branch produced the last chunk size.
// Thread-local so cursors stepped on pool workers don't clobber each other.
void set_last_sizing(const char* value);
void clear_sizing();
std::string get_last_sizing();

// Separate channel for byte source operations ("io.read", "io.seek", ...).
void set_last_io(const char* value);
void clear_io();
std::string get_last_io();

// Number of source reads issued on this thread since the last clear_io().
uint64_t get_read_count();

} // namespace getchunk::debug_trace
