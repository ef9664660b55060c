#include "bindings_common.hpp"

#include "getchunk/core/Config.hpp"
#include "getchunk/core/DebugTrace.hpp"
#include "getchunk/core/MemoryProbe.hpp"
#include "getchunk/core/ParallelUtils.hpp"
#include "getchunk/core/SystemUtils.hpp"

using namespace getchunk;

void bind_core_classes(py::module_& m) {
    m.def("set_memory_limit", &set_memory_limit, py::arg("bytes"),
          "Cap the memory considered available for a chunk (0 removes the cap).");
    m.def("get_memory_limit", &get_memory_limit);
    m.def("set_include_swap_default", &set_include_swap_default, py::arg("enabled"));
    m.def("get_include_swap_default", &get_include_swap_default);
    m.def("set_verbose", &set_verbose, py::arg("enabled"));
    m.def("is_verbose", &is_verbose);
    m.def("set_num_threads", &ThreadPool::set_num_threads, py::arg("n"),
          "Worker count for ChunkStream reads; only effective before the first stream read.");
    m.def("get_num_threads", &ThreadPool::get_num_threads);

    m.def("available_ram", []() {
        return core::SystemMemoryProbe::instance()->available_ram();
    });
    m.def("available_ram_and_swap", []() {
        return core::SystemMemoryProbe::instance()->available_ram_and_swap();
    });
    m.def("total_ram", &SystemUtils::get_total_ram);

    // Test hooks
    auto trace = m.def_submodule("_debug", "Internal trace hooks used by the test-suite");
    trace.def("last_sizing", &debug_trace::get_last_sizing);
    trace.def("clear_sizing", &debug_trace::clear_sizing);
    trace.def("last_io", &debug_trace::get_last_io);
    trace.def("clear_io", &debug_trace::clear_io);
}
