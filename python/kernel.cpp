#include "../include/smosvm_bits/kernel.hpp"

#include <pybind11/eigen.h>
#include <pybind11/pybind11.h>
namespace py = pybind11;

using smosvm::Kernel;

void init_kernel(py::module &m) {

    py::class_<Kernel> kernel(m, "Kernel");

    py::enum_<Kernel::Type>(kernel, "Type")
    .value("Linear", Kernel::Type::Linear)
    .value("Polynomial", Kernel::Type::Polynomial)
    .value("Rbf", Kernel::Type::Rbf);

    kernel
    .def(py::init<>())
    .def_static("linear", &Kernel::linear)
    .def_static("polynomial", &Kernel::polynomial, py::arg("gamma"), py::arg("degree"), py::arg("coef0") = 0.0)
    .def_static("rbf", &Kernel::rbf, py::arg("gamma"))
    .def_static("from_name", &Kernel::from_name,
                py::arg("name"), py::arg("gamma") = 1.0, py::arg("degree") = 3, py::arg("coef0") = 0.0)
    .def_property_readonly("type", &Kernel::type)
    .def_property_readonly("gamma", &Kernel::gamma)
    .def_property_readonly("degree", &Kernel::degree)
    .def_property_readonly("coef0", &Kernel::coef0)
    .def_property_readonly("name", &Kernel::name)
    .def("val", &Kernel::val)
    .def("gram", py::overload_cast<const Eigen::MatrixXd&, const Eigen::MatrixXd&>(&Kernel::gram, py::const_))
    .def("gram", py::overload_cast<const Eigen::MatrixXd&>(&Kernel::gram, py::const_))
    .def("__eq__", &Kernel::operator==)
    .def("__ne__", &Kernel::operator!=)
    .def("__repr__", [](const Kernel& k) { return "<smosvm.Kernel " + k.name() + ">"; });
}
