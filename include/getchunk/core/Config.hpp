#pragma once

#include <atomic>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <string>

namespace getchunk {

// --- Process-wide configuration ---
// Seeded from GETCHUNK_* environment variables on first use, overridable at runtime.

// Upper bound applied to the probed available memory (0 = no limit)
void set_memory_limit(uint64_t bytes);
uint64_t get_memory_limit();

// Whether newly created cursors count free swap as available memory
void set_include_swap_default(bool enabled);
bool get_include_swap_default();

// Verbose diagnostics on std::cerr
void set_verbose(bool enabled);
bool is_verbose();

inline std::filesystem::path get_storage_root() {
    const char* env = std::getenv("GETCHUNK_STORAGE_DIR");
    std::filesystem::path root;
    if (env && *env != '\0') {
        root = std::filesystem::path(env);
    } else {
        root = std::filesystem::temp_directory_path() / "getchunk";
    }
    std::filesystem::create_directories(root);
    return root;
}

inline std::string make_unique_storage_file(const std::string& prefix) {
    static std::atomic<uint64_t> counter{0};
    auto filename = prefix + "_" + std::to_string(counter++) + ".tmp";
    return (get_storage_root() / filename).string();
}

} // namespace getchunk
