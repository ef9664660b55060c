#pragma once
#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

#include "getchunk/io/ByteSource.hpp"

#include <memory>

namespace py = pybind11;

void bind_core_classes(py::module_& m);
void bind_chunk_classes(py::module_& m);

namespace getchunk::bindings {

// Turns a Python object into a byte source: file objects and buffered readers
// (anything with a working fileno()), bytes-like objects, io.BytesIO and str.
// Raises TypeError for anything else.
std::unique_ptr<ByteSource> make_source(const py::object& obj);

} // namespace getchunk::bindings
