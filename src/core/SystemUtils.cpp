#include "getchunk/core/SystemUtils.hpp"

#ifdef _WIN32
#include <windows.h>
#else
#include <unistd.h>
#include <sys/sysinfo.h>
#endif

namespace getchunk {

uint64_t SystemUtils::get_available_ram() {
#ifdef _WIN32
    MEMORYSTATUSEX statex;
    statex.dwLength = sizeof(statex);
    if (GlobalMemoryStatusEx(&statex)) {
        return statex.ullAvailPhys;
    }
    return 0;
#else
    struct sysinfo info;
    if (sysinfo(&info) == 0) {
        return (uint64_t)info.freeram * info.mem_unit;
    }
    return 0;
#endif
}

uint64_t SystemUtils::get_available_swap() {
#ifdef _WIN32
    MEMORYSTATUSEX statex;
    statex.dwLength = sizeof(statex);
    if (GlobalMemoryStatusEx(&statex)) {
        // The page file limit includes physical memory.
        if (statex.ullAvailPageFile > statex.ullAvailPhys) {
            return statex.ullAvailPageFile - statex.ullAvailPhys;
        }
    }
    return 0;
#else
    struct sysinfo info;
    if (sysinfo(&info) == 0) {
        return (uint64_t)info.freeswap * info.mem_unit;
    }
    return 0;
#endif
}

uint64_t SystemUtils::get_total_ram() {
#ifdef _WIN32
    MEMORYSTATUSEX statex;
    statex.dwLength = sizeof(statex);
    if (GlobalMemoryStatusEx(&statex)) {
        return statex.ullTotalPhys;
    }
    return 0;
#else
    struct sysinfo info;
    if (sysinfo(&info) == 0) {
        return (uint64_t)info.totalram * info.mem_unit;
    }
    return 0;
#endif
}

} // namespace getchunk
