#ifndef SMOSVM_ERRORS_HPP
#define SMOSVM_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace smosvm {

// Base of every error raised by the library
class Error : public std::runtime_error {
public:
    explicit Error(const std::string& what) : std::runtime_error(what) {}
};

// kernel name not in {linear, polynomial, rbf}
class UnsupportedKernel : public Error {
public:
    explicit UnsupportedKernel(const std::string& name)
        : Error("unsupported kernel: '" + name + "'"), _name(name) {}

    const std::string& name() const { return _name; }

private:
    std::string _name;
};

// degenerate label set, too few samples, shape or value problems in fit input
class InvalidTrainingData : public Error {
public:
    explicit InvalidTrainingData(const std::string& what) : Error("invalid training data: " + what) {}
};

class ModelNotFitted : public Error {
public:
    ModelNotFitted() : Error("model is not fitted, call fit() first") {}
};

// hyperparameter out of its domain (C, gamma, degree, max_iter, tol)
class InvalidParameter : public Error {
public:
    explicit InvalidParameter(const std::string& what) : Error("invalid parameter: " + what) {}
};

class DimensionMismatch : public Error {
public:
    DimensionMismatch(long expected, long got)
        : Error("expected " + std::to_string(expected) + " features, got " + std::to_string(got)) {}
};

}

#endif
