#include <pybind11/pybind11.h>

#include "../include/smosvm_bits/errors.hpp"

namespace py = pybind11;

void init_kernel(py::module &);
void init_svm(py::module &);

namespace smosvm {

PYBIND11_MODULE(smosvm, m) {
    m.doc() = "Binary SVM trained with simplified SMO";

    auto error = py::register_exception<Error>(m, "Error", PyExc_RuntimeError);
    py::register_exception<UnsupportedKernel>(m, "UnsupportedKernel", error.ptr());
    py::register_exception<InvalidTrainingData>(m, "InvalidTrainingData", error.ptr());
    py::register_exception<ModelNotFitted>(m, "ModelNotFitted", error.ptr());
    py::register_exception<InvalidParameter>(m, "InvalidParameter", error.ptr());
    py::register_exception<DimensionMismatch>(m, "DimensionMismatch", error.ptr());

    init_kernel(m);
    init_svm(m);
}
}
