#include "getchunk/chunk/SizingEngine.hpp"
#include "getchunk/core/DebugTrace.hpp"

#include <algorithm>
#include <sstream>

namespace getchunk {

std::string SizingMode::to_string() const {
    std::ostringstream out;
    switch (kind) {
        case SizingKind::Auto:
            out << "Auto";
            break;
        case SizingKind::Percent:
            out << "Percent(" << percent << ")";
            break;
        case SizingKind::Bytes:
            out << "Bytes(" << bytes << ")";
            break;
    }
    return out.str();
}

double SizingEngine::next_size(
    const SizingMode& mode,
    const Observation& last,
    double previous_duration,
    double total_length,
    double remaining_length,
    const core::MemoryBudget& budget
) {
    double size = 0.0;
    switch (mode.kind) {
        case SizingKind::Auto:
            size = auto_size(last, previous_duration, total_length, budget);
            break;
        case SizingKind::Percent:
            debug_trace::set_last_sizing("sizing.percent");
            size = percentage_size(total_length, mode.percent, budget);
            break;
        case SizingKind::Bytes:
            debug_trace::set_last_sizing("sizing.bytes");
            size = bytes_size(total_length, mode.bytes, budget);
            break;
    }
    return std::max(0.0, std::min(size, remaining_length));
}

double SizingEngine::auto_size(
    const Observation& last,
    double previous_duration,
    double total_length,
    const core::MemoryBudget& budget
) {
    if (last.empty()) {
        debug_trace::set_last_sizing("sizing.auto.default");
        return default_size(total_length, budget);
    }

    const double now = last.prior_duration;
    const double prev = previous_duration;
    if (now <= 0.0 || prev <= 0.0 || now == prev) {
        debug_trace::set_last_sizing("sizing.auto.hold");
        return std::min(last.prior_size, budget.ceiling());
    }

    if (now < prev) {
        debug_trace::set_last_sizing("sizing.auto.grow");
        return grow(last.prior_size, prev, now, budget);
    }
    debug_trace::set_last_sizing("sizing.auto.shrink");
    return shrink(last.prior_size, prev, now, budget);
}

double SizingEngine::default_size(double total_length, const core::MemoryBudget& budget) {
    return std::min(total_length * kDefaultFraction, budget.ceiling());
}

double SizingEngine::grow(double prior_size, double prev, double now, const core::MemoryBudget& budget) {
    const double factor = std::min((prev - now) / prev, kMaxGrowth);
    return std::min(prior_size * (1.0 + factor), budget.ceiling());
}

double SizingEngine::shrink(double prior_size, double prev, double now, const core::MemoryBudget& budget) {
    const double factor = std::min((now - prev) / prev, kMaxShrink);
    return std::min(prior_size * (1.0 - factor), budget.ceiling());
}

double SizingEngine::percentage_size(double total_length, double percent, const core::MemoryBudget& budget) {
    const double clamped = std::clamp(percent, kMinPercent, kMaxPercent);
    return std::min(total_length * clamped / 100.0, budget.ceiling());
}

double SizingEngine::bytes_size(double total_length, uint64_t requested, const core::MemoryBudget& budget) {
    return std::min(std::min(static_cast<double>(requested), total_length), budget.ceiling());
}

} // namespace getchunk
