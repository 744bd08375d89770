#ifndef SMOSVM_KERNEL_HPP
#define SMOSVM_KERNEL_HPP

#include <Eigen/Dense>
#include <string>

namespace smosvm {

using Eigen::MatrixXd;
using Eigen::VectorXd;

// Kernel family with its hyperparameters attached.
// Rows of the matrices passed to gram() are samples.
class Kernel {
public:
    enum class Type { Linear, Polynomial, Rbf };

    // linear kernel
    Kernel();

    static Kernel linear();
    // (gamma * <x,y> + coef0) ^ degree
    static Kernel polynomial(double gamma, int degree, double coef0);
    // exp(-gamma * |x-y|^2)
    static Kernel rbf(double gamma);
    // "linear", "polynomial" or "rbf"; throws UnsupportedKernel for anything else.
    // gamma, degree and coef0 are ignored where the family does not use them.
    static Kernel from_name(const std::string& name, double gamma, int degree, double coef0);

    Type type() const { return _type; }
    double gamma() const { return _gamma; }
    int degree() const { return _degree; }
    double coef0() const { return _coef0; }
    std::string name() const;

    double val(const VectorXd& x, const VectorXd& y) const;

    // n1 x n2 matrix of kernel values between rows of x1 and rows of x2
    MatrixXd gram(const MatrixXd& x1, const MatrixXd& x2) const;
    // self Gram matrix, exactly symmetric
    MatrixXd gram(const MatrixXd& x) const;

    bool operator==(const Kernel& other) const;
    bool operator!=(const Kernel& other) const { return !(*this == other); }

private:
    Kernel(Type type, double gamma, int degree, double coef0);

    Type _type;
    double _gamma;
    int _degree;
    double _coef0;
};

}

#endif
