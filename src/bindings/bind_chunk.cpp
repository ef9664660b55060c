#include "bindings_common.hpp"
#include "binding_warnings.hpp"

#include "getchunk/chunk/ChunkCursor.hpp"
#include "getchunk/chunk/ChunkIterator.hpp"
#include "getchunk/chunk/ChunkStream.hpp"
#include "getchunk/chunk/SizingEngine.hpp"

#include <Python.h>

#include <cstring>
#include <future>
#include <optional>
#include <string>

using namespace getchunk;

namespace getchunk::bindings {

namespace {

std::vector<uint8_t> copy_buffer(const py::buffer& buffer) {
    py::buffer_info info = buffer.request();
    if (info.ndim > 1 || (info.ndim == 1 && info.strides[0] != info.itemsize)) {
        throw py::type_error("Only contiguous one-dimensional buffers can be read in chunks");
    }
    std::vector<uint8_t> bytes(static_cast<size_t>(info.size * info.itemsize));
    if (!bytes.empty()) {
        std::memcpy(bytes.data(), info.ptr, bytes.size());
    }
    return bytes;
}

std::optional<int> try_fileno(const py::object& obj) {
    if (!py::hasattr(obj, "fileno")) return std::nullopt;
    try {
        return obj.attr("fileno")().cast<int>();
    } catch (py::error_already_set& e) {
        // io.BytesIO and friends raise io.UnsupportedOperation (an OSError).
        if (e.matches(PyExc_OSError)) return std::nullopt;
        throw;
    }
}

} // namespace

std::unique_ptr<ByteSource> make_source(const py::object& obj) {
    if (py::isinstance<py::str>(obj)) {
        return from_string(obj.cast<std::string>());
    }
    if (PyObject_CheckBuffer(obj.ptr())) {
        return from_bytes(copy_buffer(py::reinterpret_borrow<py::buffer>(obj)));
    }
    if (auto fd = try_fileno(obj)) {
        // Flush what a buffered writer may still hold before reading the descriptor.
        if (py::hasattr(obj, "flush")) obj.attr("flush")();
        return from_descriptor(*fd);
    }
    if (py::hasattr(obj, "getbuffer")) {
        return from_bytes(copy_buffer(py::reinterpret_borrow<py::buffer>(obj.attr("getbuffer")())));
    }
    throw py::type_error("Cannot read chunks from object of type '" +
                         std::string(Py_TYPE(obj.ptr())->tp_name) + "'");
}

} // namespace getchunk::bindings

namespace {

SizingMode checked_percent(double p) {
    if (p < SizingEngine::kMinPercent || p > SizingEngine::kMaxPercent) {
        bindings_warn::warn_once(
            "percent-clamp",
            "SizingMode.percent value " + std::to_string(p) + " is clamped to [0.1, 100]");
    }
    return SizingMode::percentage(p);
}

py::bytes to_py_bytes(const std::vector<uint8_t>& data) {
    return py::bytes(reinterpret_cast<const char*>(data.data()), data.size());
}

std::unique_ptr<ChunkCursor> make_cursor(const py::object& source) {
    return std::make_unique<ChunkCursor>(getchunk::bindings::make_source(source));
}

} // namespace

void bind_chunk_classes(py::module_& m) {
    py::enum_<SizingKind>(m, "SizingKind")
        .value("AUTO", SizingKind::Auto)
        .value("PERCENT", SizingKind::Percent)
        .value("BYTES", SizingKind::Bytes);

    py::class_<SizingMode>(m, "SizingMode")
        .def_static("auto", &SizingMode::automatic)
        .def_static("percent", &checked_percent, py::arg("value"))
        .def_static("bytes", &SizingMode::fixed_bytes, py::arg("count"))
        .def_readonly("kind", &SizingMode::kind)
        .def_readonly("percent_value", &SizingMode::percent)
        .def_readonly("byte_count", &SizingMode::bytes)
        .def("__eq__", &SizingMode::operator==)
        .def("__repr__", [](const SizingMode& mode) { return "SizingMode." + mode.to_string(); });

    py::class_<ChunkIterator>(m, "ChunkIterator")
        .def(py::init([](const py::object& source) {
            return std::make_unique<ChunkIterator>(make_cursor(source));
        }), py::arg("source"))
        .def_static("open", [](const std::string& path) {
            return std::make_unique<ChunkIterator>(path);
        }, py::arg("path"))
        .def("set_mode", &ChunkIterator::set_mode, py::arg("mode"), py::return_value_policy::reference_internal)
        .def("set_start_position", &ChunkIterator::set_start_position, py::arg("offset"),
             py::return_value_policy::reference_internal)
        .def("set_start_position_percent", &ChunkIterator::set_start_position_percent, py::arg("percent"),
             py::return_value_policy::reference_internal)
        .def("include_available_swap", &ChunkIterator::include_available_swap, py::arg("enabled") = true,
             py::return_value_policy::reference_internal)
        .def_property_readonly("total_length", &ChunkIterator::total_length)
        .def_property_readonly("position", [](const ChunkIterator& it) { return it.cursor().position(); })
        .def("is_read_complete", &ChunkIterator::is_read_complete)
        .def("__iter__", [](py::object self) { return self; })
        .def("__next__", [](ChunkIterator& it) {
            std::optional<std::vector<uint8_t>> chunk;
            {
                py::gil_scoped_release release;
                chunk = it.next();
            }
            if (!chunk) throw py::stop_iteration();
            return to_py_bytes(*chunk);
        });

    py::class_<ChunkStream>(m, "ChunkStream")
        .def(py::init([](const py::object& source) {
            return std::make_unique<ChunkStream>(make_cursor(source));
        }), py::arg("source"))
        .def_static("open", [](const std::string& path) {
            return std::make_unique<ChunkStream>(path);
        }, py::arg("path"))
        .def("set_mode", &ChunkStream::set_mode, py::arg("mode"), py::return_value_policy::reference_internal)
        .def("set_start_position", &ChunkStream::set_start_position, py::arg("offset"),
             py::return_value_policy::reference_internal)
        .def("set_start_position_percent", &ChunkStream::set_start_position_percent, py::arg("percent"),
             py::return_value_policy::reference_internal)
        .def("include_available_swap", &ChunkStream::include_available_swap, py::arg("enabled") = true,
             py::return_value_policy::reference_internal)
        .def_property_readonly("total_length", &ChunkStream::total_length)
        .def("is_read_complete", &ChunkStream::is_read_complete)
        .def("__aiter__", [](py::object self) { return self; })
        .def("__anext__", [](ChunkStream& stream) {
            // The read runs on the C++ pool; the default executor only waits on the future.
            auto pending = std::make_shared<std::future<ChunkResult>>(stream.next());
            py::cpp_function wait([pending]() -> py::object {
                ChunkResult result;
                {
                    py::gil_scoped_release release;
                    result = pending->get();
                }
                if (result.is_end()) {
                    PyErr_SetNone(PyExc_StopAsyncIteration);
                    throw py::error_already_set();
                }
                result.rethrow();
                return to_py_bytes(result.bytes);
            });
            py::object loop = py::module_::import("asyncio").attr("get_running_loop")();
            return loop.attr("run_in_executor")(py::none(), wait);
        });
}
