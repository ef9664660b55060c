#pragma once

#include <cstdint>
#include <string>

namespace getchunk {

enum class SizingKind {
    Auto,    // adapt every step from read-latency feedback
    Percent, // fixed fraction of the total source length
    Bytes    // fixed byte count
};

/**
 * @brief How the next chunk size is chosen.
 * 
 * The percentage is stored as given and clamped to [0.1, 100] only when a
 * size is computed, so the caller's value stays observable.
 */
struct SizingMode {
    SizingKind kind;
    double percent;
    uint64_t bytes;

    SizingMode() : kind(SizingKind::Auto), percent(0.0), bytes(0) {}

    static SizingMode automatic() {
        return SizingMode();
    }

    static SizingMode percentage(double p) {
        SizingMode m;
        m.kind = SizingKind::Percent;
        m.percent = p;
        return m;
    }

    static SizingMode fixed_bytes(uint64_t n) {
        SizingMode m;
        m.kind = SizingKind::Bytes;
        m.bytes = n;
        return m;
    }

    bool operator==(const SizingMode& other) const {
        return kind == other.kind && percent == other.percent && bytes == other.bytes;
    }

    std::string to_string() const;
};

/**
 * @brief Outcome of the most recently completed read.
 * 
 * Both fields are zero before the first read.
 */
struct Observation {
    double prior_size = 0.0;     // bytes actually returned
    double prior_duration = 0.0; // seconds

    bool empty() const { return prior_size <= 0.0; }
};

} // namespace getchunk
