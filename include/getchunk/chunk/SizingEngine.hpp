#pragma once

#include "getchunk/chunk/SizingMode.hpp"
#include "getchunk/core/MemoryProbe.hpp"

namespace getchunk {

/**
 * @brief Computes the size of the next chunk.
 * 
 * Pure function of its inputs; all mutable state lives in ChunkCursor.
 * 
 * Auto mode compares the duration of the last read ("now") with the one
 * before it ("prev"):
 *   - no history:           total_length * 0.001
 *   - now or prev unknown:  hold the last size
 *   - now < prev (faster):  grow by (prev - now) / prev, at most 15%
 *   - now > prev (slower):  shrink by (now - prev) / prev, at most 45%
 * 
 * Every mode is capped at 85% of the available memory and at the bytes
 * remaining in the source.
 */
class SizingEngine {
public:
    static constexpr double kDefaultFraction = 0.001;
    static constexpr double kMaxGrowth = 0.15;
    static constexpr double kMaxShrink = 0.45;
    static constexpr double kMinPercent = 0.1;
    static constexpr double kMaxPercent = 100.0;

    /**
     * @brief Next chunk size in (fractional) bytes.
     * 
     * @param mode Configured sizing mode.
     * @param last Size and duration of the most recent read.
     * @param previous_duration Duration of the read before that (0 if none).
     * @param total_length Total length of the source.
     * @param remaining_length Bytes left between the cursor and the end.
     * @param budget Memory budget sampled for this decision.
     */
    static double next_size(
        const SizingMode& mode,
        const Observation& last,
        double previous_duration,
        double total_length,
        double remaining_length,
        const core::MemoryBudget& budget
    );

    static double default_size(double total_length, const core::MemoryBudget& budget);
    static double grow(double prior_size, double prev, double now, const core::MemoryBudget& budget);
    static double shrink(double prior_size, double prev, double now, const core::MemoryBudget& budget);
    static double percentage_size(double total_length, double percent, const core::MemoryBudget& budget);
    static double bytes_size(double total_length, uint64_t requested, const core::MemoryBudget& budget);

private:
    static double auto_size(
        const Observation& last,
        double previous_duration,
        double total_length,
        const core::MemoryBudget& budget
    );
};

} // namespace getchunk
