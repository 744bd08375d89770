#include "../include/smosvm_bits/svm.hpp"
#include "../include/smosvm_bits/errors.hpp"
#include "../include/smosvm_bits/logging.hpp"

#include <algorithm>
#include <cmath>
#include <set>

namespace smosvm {

constexpr double svm::_alpha_epsilon;

struct svm::SmoState {
    MatrixXd k;
    VectorXd y;
    VectorXd a;
    double b;
    double c;
};

svm::svm(double c, std::string kernel_name, double gamma, int degree, double coef0) {
    if (!(c > 0)) {
        throw InvalidParameter("C must be positive, got " + std::to_string(c));
    }
    this->_c = c;
    this->_kernel_name = std::move(kernel_name);
    this->_gamma = gamma;
    this->_degree = degree;
    this->_coef0 = coef0;
    this->_random = std::make_shared<Mt19937Source>();
}

svm::svm(double c, const Kernel& kernel)
    : svm(c, kernel.name(), kernel.gamma(), kernel.degree(), kernel.coef0()) {}

svm::svm(const svm& other)
    : _c(other._c),
      _kernel_name(other._kernel_name),
      _gamma(other._gamma),
      _degree(other._degree),
      _coef0(other._coef0),
      _random(other._random->clone()),
      _model(other._model) {}

svm& svm::operator=(const svm& other) {
    if (this != &other) {
        std::shared_ptr<RandomSource> random = other._random->clone();
        this->_c = other._c;
        this->_kernel_name = other._kernel_name;
        this->_gamma = other._gamma;
        this->_degree = other._degree;
        this->_coef0 = other._coef0;
        this->_random = std::move(random);
        this->_model = other._model;
    }
    return *this;
}

void svm::set_random_source(std::shared_ptr<RandomSource> source) {
    if (!source) {
        throw InvalidParameter("random source must not be null");
    }
    this->_random = std::move(source);
}

Kernel svm::_resolve_kernel() const {
    return Kernel::from_name(_kernel_name, _gamma, _degree, _coef0);
}

std::pair<double, double> svm::_check_training_data(const MatrixXd& x, const VectorXd& y) const {
    if (x.rows() < 2) {
        throw InvalidTrainingData("need at least 2 samples, got " + std::to_string(x.rows()));
    }
    if (x.rows() != y.size()) {
        throw InvalidTrainingData(std::to_string(x.rows()) + " samples but " + std::to_string(y.size()) + " labels");
    }
    if (x.cols() == 0) {
        throw InvalidTrainingData("samples have no features");
    }
    if (!x.allFinite() || !y.allFinite()) {
        throw InvalidTrainingData("features and labels must be finite");
    }
    std::set<double> classes(y.data(), y.data() + y.size());
    if (classes.size() != 2) {
        throw InvalidTrainingData("expected exactly 2 distinct labels, got " + std::to_string(classes.size()));
    }
    return std::make_pair(*classes.begin(), *classes.rbegin());
}

double svm::_helper_smo(const SmoState& s, int i) const {
    return s.a.cwiseProduct(s.y).dot(s.k.col(i)) + s.b - s.y(i);
}

int svm::_find_random_j(int i, int n) {
    int j = _random->next_index(n);
    while (j == i) {
        j = _random->next_index(n);
    }
    return j;
}

// Jointly optimize alpha_i and alpha_j. Returns false when the pair cannot move.
bool svm::_take_step(SmoState& s, int i, int j, double e_i) {
    double e_j = _helper_smo(s, j);
    double a_i_old = s.a(i);
    double a_j_old = s.a(j);
    double y_i = s.y(i);
    double y_j = s.y(j);

    double L, H;
    if (y_i != y_j) {
        L = std::max(0.0, a_j_old - a_i_old);
        H = std::min(s.c, s.c + a_j_old - a_i_old);
    } else {
        L = std::max(0.0, a_i_old + a_j_old - s.c);
        H = std::min(s.c, a_i_old + a_j_old);
    }
    if (L == H) {
        return false;
    }

    double eta = 2 * s.k(i, j) - s.k(i, i) - s.k(j, j);
    if (eta >= 0) {
        return false;
    }

    double a_j = a_j_old - y_j * (e_i - e_j) / eta;
    a_j = std::min(std::max(a_j, L), H);
    if (std::fabs(a_j - a_j_old) < _alpha_epsilon) {
        return false;
    }
    double a_i = a_i_old + y_i * y_j * (a_j_old - a_j);
    // exact in real arithmetic, rounding can leave the box by an ulp
    a_i = std::min(std::max(a_i, 0.0), s.c);

    double b1 = s.b - e_i - y_i * (a_i - a_i_old) * s.k(i, i) - y_j * (a_j - a_j_old) * s.k(i, j);
    double b2 = s.b - e_j - y_i * (a_i - a_i_old) * s.k(i, j) - y_j * (a_j - a_j_old) * s.k(j, j);
    if (a_i > 0 && a_i < s.c) {
        s.b = b1;
    } else if (a_j > 0 && a_j < s.c) {
        s.b = b2;
    } else {
        s.b = (b1 + b2) / 2;
    }
    s.a(i) = a_i;
    s.a(j) = a_j;
    return true;
}

// Returns true if a full pass went by without any change.
bool svm::_simplified_smo(SmoState& s, int max_iter, double tol, int& passes) {
    int n = static_cast<int>(s.a.size());
    for (passes = 0; passes < max_iter;) {
        int num_changed_alpha = 0;
        for (int i = 0; i < n; i++) {
            double e_i = _helper_smo(s, i);
            double r_i = s.y(i) * e_i;
            if ((r_i < -tol && s.a(i) < s.c) || (r_i > tol && s.a(i) > 0)) {
                int j = _find_random_j(i, n);
                if (_take_step(s, i, j, e_i)) {
                    num_changed_alpha++;
                }
            }
        }
        passes++;
        logger()->debug("smo pass {}: {} pairs changed, b = {}", passes, num_changed_alpha, s.b);
        if (num_changed_alpha == 0) {
            return true;
        }
    }
    return false;
}

void svm::fit(const MatrixXd& x, const VectorXd& y, int max_iter, double tol) {
    Kernel kernel = _resolve_kernel();
    if (max_iter <= 0) {
        throw InvalidParameter("max_iter must be positive, got " + std::to_string(max_iter));
    }
    if (!(tol > 0)) {
        throw InvalidParameter("tol must be positive, got " + std::to_string(tol));
    }
    std::pair<double, double> classes = _check_training_data(x, y);

    int n = static_cast<int>(x.rows());
    SmoState s;
    s.y = VectorXd(n);
    for (int i = 0; i < n; i++) {
        s.y(i) = y(i) == classes.first ? -1.0 : 1.0;
    }
    s.a = VectorXd::Zero(n);
    s.b = 0.0;
    s.c = _c;
    // kernel values precalculated, symmetric
    s.k = kernel.gram(x);

    int passes = 0;
    bool converged = _simplified_smo(s, max_iter, tol, passes);
    if (!converged) {
        logger()->warn("smo stopped after max_iter = {} passes without a pass free of changes", max_iter);
    }

    auto model = std::make_shared<TrainedModel>();
    model->kernel = kernel;
    for (int i = 0; i < n; i++) {
        if (s.a(i) > _alpha_epsilon) {
            model->support_indices.push_back(i);
        }
    }
    int m = static_cast<int>(model->support_indices.size());
    model->support_vectors = MatrixXd(m, x.cols());
    model->support_labels = VectorXd(m);
    model->support_alphas = VectorXd(m);
    for (int r = 0; r < m; r++) {
        int i = model->support_indices[r];
        model->support_vectors.row(r) = x.row(i);
        model->support_labels(r) = s.y(i);
        model->support_alphas(r) = s.a(i);
    }
    model->b = s.b;
    model->negative_class = classes.first;
    model->positive_class = classes.second;
    model->n_iter = passes;
    model->converged = converged;

    logger()->info("trained {} kernel svm on {} samples: {} support vectors, {} passes, b = {}",
                   kernel.name(), n, m, passes, s.b);
    this->_model = model;
}

VectorXd svm::decision_function(const MatrixXd& x) const {
    const TrainedModel& model = _fitted();
    if (x.cols() != model.support_vectors.cols()) {
        throw DimensionMismatch(model.support_vectors.cols(), x.cols());
    }
    VectorXd coef = model.support_alphas.cwiseProduct(model.support_labels);
    VectorXd f = model.kernel.gram(x, model.support_vectors) * coef;
    return (f.array() + model.b).matrix();
}

VectorXd svm::predict(const MatrixXd& x) const {
    VectorXd f = decision_function(x);
    return f.unaryExpr([](double v) { return double((v > 0) - (v < 0)); });
}

const TrainedModel& svm::_fitted() const {
    if (!_model) {
        throw ModelNotFitted();
    }
    return *_model;
}

std::shared_ptr<const TrainedModel> svm::trained_model() const {
    _fitted();
    return _model;
}

const Kernel& svm::kernel() const {
    return _fitted().kernel;
}

const MatrixXd& svm::support_vectors() const {
    return _fitted().support_vectors;
}

const VectorXd& svm::support_alphas() const {
    return _fitted().support_alphas;
}

const VectorXd& svm::support_labels() const {
    return _fitted().support_labels;
}

const std::vector<int>& svm::support_indices() const {
    return _fitted().support_indices;
}

VectorXd svm::dual_coef() const {
    const TrainedModel& model = _fitted();
    return model.support_alphas.cwiseProduct(model.support_labels);
}

double svm::bias() const {
    return _fitted().b;
}

int svm::n_support() const {
    return static_cast<int>(_fitted().support_indices.size());
}

std::pair<double, double> svm::classes() const {
    const TrainedModel& model = _fitted();
    return std::make_pair(model.negative_class, model.positive_class);
}

int svm::n_iter() const {
    return _fitted().n_iter;
}

bool svm::converged() const {
    return _fitted().converged;
}

}
