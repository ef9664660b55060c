#pragma once

#include <cstdint>

namespace getchunk {

class SystemUtils {
public:
    /**
     * @brief Get the currently available physical memory (RAM) in bytes.
     * 
     * @return uint64_t Available RAM in bytes, or 0 if the OS query fails.
     */
    static uint64_t get_available_ram();

    /**
     * @brief Get the currently free swap space in bytes.
     * 
     * @return uint64_t Free swap in bytes, or 0 if there is none or the query fails.
     */
    static uint64_t get_available_swap();

    /**
     * @brief Get the total physical memory (RAM) installed in the system in bytes.
     * 
     * @return uint64_t Total RAM in bytes.
     */
    static uint64_t get_total_ram();
};

} // namespace getchunk
