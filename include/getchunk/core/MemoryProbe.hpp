#pragma once

#include <memory>

namespace getchunk {
namespace core {

// Fraction of the available memory a single chunk may occupy.
constexpr double kMemoryCeilingRatio = 0.85;

/**
 * @brief Memory available to the next chunk, sampled at the moment a size decision is made.
 */
struct MemoryBudget {
    double available;   // bytes
    bool include_swap;

    MemoryBudget() : available(0.0), include_swap(false) {}
    MemoryBudget(double available_bytes, bool swap)
        : available(available_bytes), include_swap(swap) {}

    // Usable ceiling for one chunk
    double ceiling() const { return available * kMemoryCeilingRatio; }
};

/**
 * @brief Reports how much memory the system can currently hand out.
 * 
 * Implementations must reflect the system state at call time; callers never
 * cache the result across size decisions.
 */
class MemoryProbe {
public:
    virtual ~MemoryProbe() = default;

    /**
     * @brief Currently available physical memory in bytes.
     */
    virtual double available_ram() const = 0;

    /**
     * @brief Currently available physical memory plus free swap in bytes.
     */
    virtual double available_ram_and_swap() const = 0;

    /**
     * @brief Samples the probe and applies the process-wide memory limit.
     * 
     * @param include_swap Count free swap as available memory.
     */
    MemoryBudget budget(bool include_swap) const;
};

/**
 * @brief MemoryProbe backed by the operating system (sysinfo / GlobalMemoryStatusEx).
 */
class SystemMemoryProbe : public MemoryProbe {
public:
    static std::shared_ptr<const MemoryProbe> instance();

    double available_ram() const override;
    double available_ram_and_swap() const override;
};

} // namespace core
} // namespace getchunk
