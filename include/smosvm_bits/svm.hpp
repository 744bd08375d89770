#ifndef SMOSVM_SVM_HPP
#define SMOSVM_SVM_HPP

#include <Eigen/Dense>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "kernel.hpp"
#include "random_source.hpp"

namespace smosvm {

using Eigen::MatrixXd;
using Eigen::VectorXd;

// Everything a fit leaves behind. Built once at the end of svm::fit and never
// modified; the next fit replaces it.
struct TrainedModel {
    Kernel kernel;
    // one support vector per row
    MatrixXd support_vectors;
    // normalized labels, -1 or +1
    VectorXd support_labels;
    // multipliers, each in (1e-5, C]
    VectorXd support_alphas;
    // rows of the training matrix the support vectors came from
    std::vector<int> support_indices;
    double b = 0.0;
    // original label values mapped to -1 and +1
    double negative_class = -1.0;
    double positive_class = 1.0;
    int n_iter = 0;
    bool converged = false;
};

// Binary soft margin SVM trained with simplified SMO.
// f(x) = sum(alpha_i * y_i * K(x, sv_i)) + b, predict(x) = sign(f(x))
class svm {
public:
    // kernel_name is resolved when fit() runs, an unknown name fails there
    svm(double c, std::string kernel_name, double gamma = 1.0, int degree = 3, double coef0 = 0.0);
    svm(double c, const Kernel& kernel);
    // copies share the fitted state but get their own clone of the random source
    svm(const svm& other);
    svm& operator=(const svm& other);
    ~svm() = default;

    void fit(const MatrixXd& x, const VectorXd& y, int max_iter = 1000, double tol = 1e-3);
    VectorXd decision_function(const MatrixXd& x) const;
    // entries in {-1, 0, +1}, 0 only on the decision boundary
    VectorXd predict(const MatrixXd& x) const;

    void set_random_source(std::shared_ptr<RandomSource> source);

    double c() const { return _c; }
    const std::string& kernel_name() const { return _kernel_name; }
    bool is_fitted() const { return _model != nullptr; }

    // the accessors below throw ModelNotFitted before the first successful fit
    std::shared_ptr<const TrainedModel> trained_model() const;
    const Kernel& kernel() const;
    const MatrixXd& support_vectors() const;
    const VectorXd& support_alphas() const;
    const VectorXd& support_labels() const;
    const std::vector<int>& support_indices() const;
    VectorXd dual_coef() const;
    double bias() const;
    int n_support() const;
    std::pair<double, double> classes() const;
    int n_iter() const;
    bool converged() const;

private:
    // multipliers of the samples at or below this value are treated as zero
    static constexpr double _alpha_epsilon = 1e-5;

    double _c;
    std::string _kernel_name;
    double _gamma;
    int _degree;
    double _coef0;

    std::shared_ptr<RandomSource> _random;
    std::shared_ptr<const TrainedModel> _model;

    // SMO working set, lives only for the duration of fit()
    struct SmoState;

    const TrainedModel& _fitted() const;
    Kernel _resolve_kernel() const;
    std::pair<double, double> _check_training_data(const MatrixXd& x, const VectorXd& y) const;
    double _helper_smo(const SmoState& s, int i) const;
    int _find_random_j(int i, int n);
    bool _take_step(SmoState& s, int i, int j, double e_i);
    bool _simplified_smo(SmoState& s, int max_iter, double tol, int& passes);
};

}

#endif
