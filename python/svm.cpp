#include "../include/smosvm_bits/svm.hpp"
#include "../include/smosvm_bits/logging.hpp"

#include <pybind11/stl.h>
#include <pybind11/eigen.h>

#include <pybind11/pybind11.h>
namespace py = pybind11;

using smosvm::svm;

// lets python subclasses of RandomSource drive partner selection
class PyRandomSource : public smosvm::RandomSource {
public:
    using smosvm::RandomSource::RandomSource;

    int next_index(int n) override {
        PYBIND11_OVERRIDE_PURE(int, smosvm::RandomSource, next_index, n);
    }

    std::shared_ptr<smosvm::RandomSource> clone() const override {
        PYBIND11_OVERRIDE_PURE(std::shared_ptr<smosvm::RandomSource>, smosvm::RandomSource, clone, );
    }
};

void init_svm(py::module &m) {

    py::class_<smosvm::RandomSource, PyRandomSource, std::shared_ptr<smosvm::RandomSource>>(m, "RandomSource")
    .def(py::init<>())
    .def("next_index", &smosvm::RandomSource::next_index)
    .def("clone", &smosvm::RandomSource::clone);

    py::class_<smosvm::Mt19937Source, smosvm::RandomSource, std::shared_ptr<smosvm::Mt19937Source>>(m, "Mt19937Source")
    .def(py::init<>())
    .def(py::init<std::uint32_t>(), py::arg("seed"))
    .def("seed", &smosvm::Mt19937Source::seed);

    py::class_<svm>(m, "svm")
    .def(py::init<double, std::string, double, int, double>(),
         py::arg("c"), py::arg("kernel"), py::arg("gamma") = 1.0, py::arg("degree") = 3, py::arg("coef0") = 0.0)
    .def(py::init<double, const smosvm::Kernel&>(), py::arg("c"), py::arg("kernel"))
    .def("fit", &svm::fit, py::arg("x"), py::arg("y"), py::arg("max_iter") = 1000, py::arg("tol") = 1e-3)
    .def("decision_function", &svm::decision_function)
    .def("predict", &svm::predict)
    .def("set_random_source", &svm::set_random_source, py::keep_alive<1, 2>())
    .def_property_readonly("c", &svm::c)
    .def_property_readonly("kernel_name", &svm::kernel_name)
    .def_property_readonly("is_fitted", &svm::is_fitted)
    .def_property_readonly("kernel", &svm::kernel)
    .def_property_readonly("support_vectors", &svm::support_vectors)
    .def_property_readonly("support_alphas", &svm::support_alphas)
    .def_property_readonly("support_labels", &svm::support_labels)
    .def_property_readonly("support_indices", &svm::support_indices)
    .def_property_readonly("dual_coef", &svm::dual_coef)
    .def_property_readonly("bias", &svm::bias)
    .def_property_readonly("n_support", &svm::n_support)
    .def_property_readonly("classes", &svm::classes)
    .def_property_readonly("n_iter", &svm::n_iter)
    .def_property_readonly("converged", &svm::converged);

    m.def("set_log_level", py::overload_cast<const std::string&>(&smosvm::set_log_level), py::arg("level"));
}
