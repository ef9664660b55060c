#include "bindings/bindings_common.hpp"
#include "getchunk/core/Errors.hpp"

#include <Python.h>

PYBIND11_MODULE(_getchunk, m) {
    m.doc() = "GetChunk: chunked file reading with adaptive chunk sizes";

    // IoError surfaces as OSError(errno, message); ConfigurationError is a
    // std::invalid_argument and maps to ValueError through pybind11's defaults.
    py::register_exception_translator([](std::exception_ptr p) {
        try {
            if (p) std::rethrow_exception(p);
        } catch (const getchunk::IoError& e) {
            py::tuple args = py::make_tuple(e.error_number(), e.what());
            PyErr_SetObject(PyExc_OSError, args.ptr());
        }
    });

    bind_core_classes(m);
    bind_chunk_classes(m);
}
