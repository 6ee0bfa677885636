#include "core/math/scalar_ops.hpp"
#include "core/math/vector_algebra.hpp"
#include "core/types/containers/named_vector.hpp"
#include "io/console/logger.hpp"
#include "io/exceptions.hpp"
#include <pybind11/functional.h>
#include <pybind11/operators.h>
#include <pybind11/pybind11.h>
#include <pybind11/stl.h>
#include <sstream>
#include <string>

namespace py = pybind11;

namespace {
    // python style negative indices
    nvec::size_type normalize_index(const nvec::NamedVector& vec, long idx)
    {
        const auto len = static_cast<long>(vec.length());
        if (idx < 0) {
            idx += len;
        }
        if (idx < 0 || idx >= len) {
            throw nvec::exception::IndexOutOfRangeException(
                static_cast<nvec::size_type>(idx < 0 ? -idx : idx),
                vec.length()
            );
        }
        return static_cast<nvec::size_type>(idx);
    }
}   // namespace

PYBIND11_MODULE(nvec_ext, m)
{
    using nvec::components_t;
    using nvec::NamedVector;
    using nvec::real;

    m.doc() = "NVEC - N-Dimensional Vector Algebra Library";

    py::register_exception<nvec::exception::DimensionMismatchException>(
        m,
        "DimensionMismatch",
        PyExc_ValueError
    );
    py::register_exception<nvec::exception::IndexOutOfRangeException>(
        m,
        "IndexOutOfRange",
        PyExc_IndexError
    );

    m.def(
        "set_log_level",
        [](const std::string& name) {
            const auto level = nvec::io::logger::level_from_string(name);
            nvec::io::logger::set_level(level);
        },
        py::arg("level"),
        "Set the console log level: error, warn, info or debug"
    );

    // expose the pure vector algebra on plain lists
    auto vecops = m.def_submodule("vecops", "vector algebra on sequences");
    vecops.def(
        "map",
        [](const std::function<real(real, nvec::size_type)>& fn,
           const components_t& v) { return nvec::vecops::map(fn, v); },
        py::arg("fn"),
        py::arg("vector")
    );
    vecops.def("add", &nvec::vecops::add, py::arg("augend"), py::arg("addend"));
    vecops.def(
        "sub",
        &nvec::vecops::sub,
        py::arg("minuend"),
        py::arg("subtrahend")
    );
    vecops.def("mul", &nvec::vecops::mul, py::arg("vector"), py::arg("factor"));
    vecops.def(
        "div",
        &nvec::vecops::div,
        py::arg("vector"),
        py::arg("divisor")
    );
    vecops.def("dot", &nvec::vecops::dot, py::arg("lhs"), py::arg("rhs"));
    vecops.def(
        "magnitude_squared",
        &nvec::vecops::magnitude_squared,
        py::arg("vector")
    );
    vecops.def("magnitude", &nvec::vecops::magnitude, py::arg("vector"));
    vecops.def("unit", &nvec::vecops::unit, py::arg("vector"));
    vecops.def("angle", &nvec::vecops::angle, py::arg("lhs"), py::arg("rhs"));
    vecops.def(
        "midpoint",
        &nvec::vecops::midpoint,
        py::arg("lhs"),
        py::arg("rhs")
    );

    auto scalar = m.def_submodule("scalar", "scalar arithmetic");
    scalar.def("add", &nvec::scalar::add);
    scalar.def("sub", &nvec::scalar::sub);
    scalar.def("mul", &nvec::scalar::mul);
    scalar.def("div", &nvec::scalar::div);
    scalar.def("square", &nvec::scalar::square);
    scalar.def("sum", [](const components_t& ns) {
        return nvec::scalar::sum(ns);
    });
    scalar.def("avg", [](const components_t& ns) {
        return nvec::scalar::avg(ns);
    });

    py::class_<NamedVector>(m, "NamedVector")
        .def(py::init<components_t>(), py::arg("components"))
        .def_property_readonly("components", &NamedVector::components)
        .def_property_readonly("length", &NamedVector::length)
        .def_property(
            "x",
            [](const NamedVector& self) { return self.x(); },
            [](NamedVector& self, real value) { self.x() = value; }
        )
        .def_property(
            "y",
            [](const NamedVector& self) { return self.y(); },
            [](NamedVector& self, real value) { self.y() = value; }
        )
        .def_property(
            "z",
            [](const NamedVector& self) { return self.z(); },
            [](NamedVector& self, real value) { self.z() = value; }
        )
        .def_property(
            "w",
            [](const NamedVector& self) { return self.w(); },
            [](NamedVector& self, real value) { self.w() = value; }
        )
        .def("__len__", &NamedVector::length)
        .def(
            "__getitem__",
            [](const NamedVector& self, long idx) {
                return self.get_item(normalize_index(self, idx));
            }
        )
        .def(
            "__setitem__",
            [](NamedVector& self, long idx, real value) {
                self.set_item(normalize_index(self, idx), value);
            }
        )
        .def("get_item", &NamedVector::get_item, py::arg("index"))
        .def("set_item", &NamedVector::set_item, py::arg("index"), py::arg("value"))
        .def("named_components", &NamedVector::named_components)
        .def(
            "map",
            [](const NamedVector& self,
               const std::function<real(real, nvec::size_type)>& fn) {
                return self.map(fn);
            },
            py::arg("fn")
        )
        .def("add", py::overload_cast<const NamedVector&>(&NamedVector::add, py::const_))
        .def("add", py::overload_cast<const components_t&>(&NamedVector::add, py::const_))
        .def("sub", py::overload_cast<const NamedVector&>(&NamedVector::sub, py::const_))
        .def("sub", py::overload_cast<const components_t&>(&NamedVector::sub, py::const_))
        .def("mul", &NamedVector::mul, py::arg("factor"))
        .def("div", &NamedVector::div, py::arg("divisor"))
        .def("dot", py::overload_cast<const NamedVector&>(&NamedVector::dot, py::const_))
        .def("dot", py::overload_cast<const components_t&>(&NamedVector::dot, py::const_))
        .def("angle", py::overload_cast<const NamedVector&>(&NamedVector::angle, py::const_))
        .def("angle", py::overload_cast<const components_t&>(&NamedVector::angle, py::const_))
        .def(
            "midpoint",
            py::overload_cast<const NamedVector&>(&NamedVector::midpoint, py::const_)
        )
        .def(
            "midpoint",
            py::overload_cast<const components_t&>(&NamedVector::midpoint, py::const_)
        )
        .def_property_readonly("magnitude", &NamedVector::magnitude)
        .def_property_readonly("magnitude_squared", &NamedVector::magnitude_squared)
        .def_property_readonly("unit", &NamedVector::unit)
        .def(-py::self)
        .def(py::self + py::self)
        .def(py::self - py::self)
        .def(py::self * real())
        .def(real() * py::self)
        .def(py::self / real())
        .def(py::self == py::self)
        .def(py::self != py::self)
        .def("__repr__", [](const NamedVector& self) {
            std::ostringstream ss;
            ss << "NamedVector" << self;
            return ss.str();
        });
}
