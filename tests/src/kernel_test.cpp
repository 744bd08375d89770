#include <gtest/gtest.h>
#include <algorithm>
#include <cmath>
#include <smosvm>

#include "datasets.hpp"

using namespace smosvm;

class KernelTest : public ::testing::Test {
protected:
    void SetUp() override {
        std::mt19937 engine(3);
        X = MatrixXd(6, 3);
        Y = MatrixXd(4, 3);
        for (int i = 0; i < X.size(); i++) {
            X(i) = 4 * jitter(engine);
        }
        for (int i = 0; i < Y.size(); i++) {
            Y(i) = 4 * jitter(engine);
        }
    }

    MatrixXd X;
    MatrixXd Y;
};

TEST_F(KernelTest, SelfGramIsSymmetricForEveryFamily) {
    Kernel kernels[] = {Kernel::linear(), Kernel::polynomial(0.5, 3, 1.0), Kernel::rbf(0.7)};
    for (const Kernel& kernel : kernels) {
        MatrixXd K = kernel.gram(X);
        ASSERT_EQ(K.rows(), X.rows());
        ASSERT_EQ(K.cols(), X.rows());
        for (int i = 0; i < K.rows(); i++) {
            for (int j = 0; j < K.cols(); j++) {
                EXPECT_NEAR(K(i, j), K(j, i), 1e-12) << kernel.name();
            }
        }
        EXPECT_TRUE(kernel.gram(X, X).isApprox(K, 1e-12)) << kernel.name();
    }
}

TEST_F(KernelTest, LinearIsMatrixProduct) {
    MatrixXd K = Kernel::linear().gram(X, Y);
    MatrixXd expected = X * Y.transpose();
    ASSERT_EQ(K.rows(), 6);
    ASSERT_EQ(K.cols(), 4);
    EXPECT_TRUE(K.isApprox(expected, 1e-14));
}

TEST_F(KernelTest, GramMatchesPairwiseValues) {
    Kernel kernels[] = {Kernel::linear(), Kernel::polynomial(0.25, 2, -1.5), Kernel::rbf(2.0)};
    for (const Kernel& kernel : kernels) {
        MatrixXd K = kernel.gram(X, Y);
        for (int i = 0; i < X.rows(); i++) {
            for (int j = 0; j < Y.rows(); j++) {
                VectorXd a = X.row(i).transpose();
                VectorXd b = Y.row(j).transpose();
                EXPECT_NEAR(K(i, j), kernel.val(a, b), 1e-9 * std::max(1.0, std::fabs(K(i, j)))) << kernel.name();
            }
        }
    }
}

TEST_F(KernelTest, PolynomialFormula) {
    VectorXd a(2), b(2);
    a << 1, 2;
    b << 3, -1;
    // <a,b> = 1
    EXPECT_DOUBLE_EQ(Kernel::polynomial(2.0, 3, 1.0).val(a, b), 27.0);
    EXPECT_DOUBLE_EQ(Kernel::polynomial(1.0, 1, 0.0).val(a, b), 1.0);
}

TEST_F(KernelTest, RbfDiagonalIsOneAndValuesInUnitInterval) {
    MatrixXd K = Kernel::rbf(1.5).gram(X);
    for (int i = 0; i < K.rows(); i++) {
        EXPECT_NEAR(K(i, i), 1.0, 1e-12);
    }
    EXPECT_GE(K.minCoeff(), 0.0);
    EXPECT_LE(K.maxCoeff(), 1.0 + 1e-12);

    VectorXd a(2), b(2);
    a << 0, 0;
    b << 1, 1;
    EXPECT_NEAR(Kernel::rbf(0.5).val(a, b), std::exp(-1.0), 1e-15);
}

TEST_F(KernelTest, FromName) {
    EXPECT_EQ(Kernel::from_name("linear", 3.0, 7, 2.0), Kernel::linear());
    EXPECT_EQ(Kernel::from_name("polynomial", 0.5, 2, 1.0), Kernel::polynomial(0.5, 2, 1.0));
    EXPECT_EQ(Kernel::from_name("rbf", 0.5, 2, 1.0), Kernel::rbf(0.5));
    EXPECT_NE(Kernel::from_name("rbf", 0.5, 2, 1.0), Kernel::rbf(0.25));
    EXPECT_EQ(Kernel::from_name("polynomial", 1.0, 2, 0.0).type(), Kernel::Type::Polynomial);
    EXPECT_EQ(Kernel::rbf(1.0).name(), "rbf");
}

TEST_F(KernelTest, UnknownNameIsRejected) {
    EXPECT_THROW(Kernel::from_name("unknown", 1.0, 3, 0.0), UnsupportedKernel);
    EXPECT_THROW(Kernel::from_name("Gaussian", 1.0, 3, 0.0), UnsupportedKernel);
    EXPECT_THROW(Kernel::from_name("", 1.0, 3, 0.0), UnsupportedKernel);
}

TEST_F(KernelTest, InvalidHyperparameters) {
    EXPECT_THROW(Kernel::polynomial(1.0, 0, 0.0), InvalidParameter);
    EXPECT_THROW(Kernel::polynomial(1.0, -2, 0.0), InvalidParameter);
    EXPECT_THROW(Kernel::polynomial(0.0, 2, 0.0), InvalidParameter);
    EXPECT_THROW(Kernel::rbf(-1.0), InvalidParameter);
    // gamma is not used by the linear kernel
    EXPECT_NO_THROW(Kernel::from_name("linear", -1.0, 0, 0.0));
}

TEST_F(KernelTest, FeatureCountMismatch) {
    MatrixXd Z = MatrixXd::Ones(2, 4);
    EXPECT_THROW(Kernel::rbf(1.0).gram(X, Z), DimensionMismatch);
    EXPECT_THROW(Kernel::linear().val(VectorXd::Ones(2), VectorXd::Ones(3)), DimensionMismatch);
}
