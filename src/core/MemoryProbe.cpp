#include "getchunk/core/MemoryProbe.hpp"
#include "getchunk/core/Config.hpp"
#include "getchunk/core/SystemUtils.hpp"

#include <algorithm>

namespace getchunk {
namespace core {

MemoryBudget MemoryProbe::budget(bool include_swap) const {
    double available = include_swap ? available_ram_and_swap() : available_ram();
    uint64_t limit = get_memory_limit();
    if (limit > 0) {
        available = std::min(available, static_cast<double>(limit));
    }
    return MemoryBudget(std::max(available, 0.0), include_swap);
}

std::shared_ptr<const MemoryProbe> SystemMemoryProbe::instance() {
    static std::shared_ptr<const MemoryProbe> probe = std::make_shared<SystemMemoryProbe>();
    return probe;
}

double SystemMemoryProbe::available_ram() const {
    return static_cast<double>(SystemUtils::get_available_ram());
}

double SystemMemoryProbe::available_ram_and_swap() const {
    return static_cast<double>(SystemUtils::get_available_ram()) +
           static_cast<double>(SystemUtils::get_available_swap());
}

} // namespace core
} // namespace getchunk
