#include "../include/smosvm_bits/kernel.hpp"
#include "../include/smosvm_bits/errors.hpp"

#include <cmath>

namespace smosvm {

Kernel::Kernel() : Kernel(Type::Linear, 1.0, 1, 0.0) {}

Kernel::Kernel(Type type, double gamma, int degree, double coef0) {
    this->_type = type;
    this->_gamma = gamma;
    this->_degree = degree;
    this->_coef0 = coef0;
}

Kernel Kernel::linear() {
    return Kernel();
}

Kernel Kernel::polynomial(double gamma, int degree, double coef0) {
    if (!(gamma > 0)) {
        throw InvalidParameter("gamma must be positive, got " + std::to_string(gamma));
    }
    if (degree <= 0) {
        throw InvalidParameter("degree must be a positive integer, got " + std::to_string(degree));
    }
    return Kernel(Type::Polynomial, gamma, degree, coef0);
}

Kernel Kernel::rbf(double gamma) {
    if (!(gamma > 0)) {
        throw InvalidParameter("gamma must be positive, got " + std::to_string(gamma));
    }
    return Kernel(Type::Rbf, gamma, 1, 0.0);
}

Kernel Kernel::from_name(const std::string& name, double gamma, int degree, double coef0) {
    if (name == "linear") {
        return linear();
    } else if (name == "polynomial") {
        return polynomial(gamma, degree, coef0);
    } else if (name == "rbf") {
        return rbf(gamma);
    }
    throw UnsupportedKernel(name);
}

std::string Kernel::name() const {
    switch (_type) {
    case Type::Linear:
        return "linear";
    case Type::Polynomial:
        return "polynomial";
    case Type::Rbf:
        return "rbf";
    }
    throw UnsupportedKernel(std::to_string(static_cast<int>(_type)));
}

double Kernel::val(const VectorXd& x, const VectorXd& y) const {
    if (x.size() != y.size()) {
        throw DimensionMismatch(x.size(), y.size());
    }
    switch (_type) {
    case Type::Linear:
        return x.dot(y);
    case Type::Polynomial:
        return std::pow(_gamma * x.dot(y) + _coef0, _degree);
    case Type::Rbf:
        return std::exp(-_gamma * (x - y).squaredNorm());
    }
    throw UnsupportedKernel(std::to_string(static_cast<int>(_type)));
}

MatrixXd Kernel::gram(const MatrixXd& x1, const MatrixXd& x2) const {
    if (x1.cols() != x2.cols()) {
        throw DimensionMismatch(x1.cols(), x2.cols());
    }
    MatrixXd dot = x1 * x2.transpose();
    switch (_type) {
    case Type::Linear:
        return dot;
    case Type::Polynomial:
        return ((_gamma * dot).array() + _coef0).pow(static_cast<double>(_degree)).matrix();
    case Type::Rbf: {
        // |a-b|^2 = |a|^2 + |b|^2 - 2<a,b>, rounding can push it slightly below zero
        VectorXd sq1 = x1.rowwise().squaredNorm();
        VectorXd sq2 = x2.rowwise().squaredNorm();
        MatrixXd dist = -2.0 * dot;
        dist.colwise() += sq1;
        dist.rowwise() += sq2.transpose();
        return (-_gamma * dist.cwiseMax(0.0)).array().exp().matrix();
    }
    }
    throw UnsupportedKernel(std::to_string(static_cast<int>(_type)));
}

MatrixXd Kernel::gram(const MatrixXd& x) const {
    MatrixXd k = gram(x, x);
    return 0.5 * (k + k.transpose());
}

bool Kernel::operator==(const Kernel& other) const {
    if (_type != other._type) {
        return false;
    }
    switch (_type) {
    case Type::Linear:
        return true;
    case Type::Polynomial:
        return _gamma == other._gamma && _degree == other._degree && _coef0 == other._coef0;
    case Type::Rbf:
        return _gamma == other._gamma;
    }
    return false;
}

}
