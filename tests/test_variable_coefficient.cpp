#include <gtest/gtest.h>
#include "periodic_operators.h"
#include "test_utils.h"
#include <cmath>

using namespace sbp;
using sbp_test::max_abs;
using sbp_test::sample_vector;

TEST(VariableCoefficient, UnitCoefficientReproducesQSquared) {
    const int m = 24;
    const double h = 0.125;
    for (int order : {2, 4, 6, 8, 10, 12}) {
        VariableCoefficientOperator M = build_variable_second_derivative(m, h, order);
        PeriodicOperator op = build_periodic_explicit(m, h, order);

        Matrix Q = Matrix(op.Q);
        Matrix expected = -(1.0 / h) * Q * Q;
        EXPECT_LT(max_abs(Matrix(Matrix(M(Vector::Ones(m))) - expected)), 1e-12) << "order " << order;
    }
}

TEST(VariableCoefficient, IsLinearInCoefficient) {
    const int m = 30;
    VariableCoefficientOperator M = build_variable_second_derivative(m, 0.1, 4);

    Vector c1 = sample_vector(m, 1).array() + 2.0;
    Vector c2 = sample_vector(m, 2).array() + 2.0;
    Matrix combined = Matrix(M(Vector(3.0 * c1 - 0.5 * c2)));
    Matrix separate = 3.0 * Matrix(M(c1)) - 0.5 * Matrix(M(c2));
    EXPECT_LT(max_abs(Matrix(combined - separate)), 1e-12);
}

TEST(VariableCoefficient, IsSymmetricPositiveSemidefiniteForPositiveCoefficient) {
    const int m = 28;
    VariableCoefficientOperator M = build_variable_second_derivative(m, 0.1, 6);

    Vector c = sample_vector(m, 5).array() + 1.5;
    Matrix A = Matrix(M(c));
    EXPECT_LT(max_abs(Matrix(A - A.transpose())), 1e-12);

    Eigen::SelfAdjointEigenSolver<Matrix> eig(A);
    EXPECT_GT(eig.eigenvalues().minCoeff(), -1e-10);

    // Constants are in the null space
    EXPECT_LT(max_abs(Vector(A * Vector::Ones(m))), 1e-11);
}

TEST(VariableCoefficient, ApproximatesDivergenceForm) {
    // -H^{-1} M(c) u approximates (c u')' with c = 2 + sin(2 pi x), u = sin(2 pi x)
    const int m = 128;
    const double h = 1.0 / m;
    const double k = 2.0 * M_PI;
    VariableCoefficientOperator M = build_variable_second_derivative(m, h, 6);

    Vector x = Vector::LinSpaced(m, 0.0, (m - 1) * h);
    Vector c = (k * x).array().sin() + 2.0;
    Vector u = (k * x).array().sin();
    // (c u')' = c' u' + c u''
    Vector exact = (k * k) * ((k * x).array().cos().square()
                              - ((k * x).array().sin() + 2.0) * (k * x).array().sin()).matrix();

    Vector approx = -(1.0 / h) * (M(c) * u);
    EXPECT_LT(max_abs(Vector(approx - exact)), 2e-6);
}

TEST(VariableCoefficient, ClosureOutlivesBuilderArguments) {
    VariableCoefficientOperator M;
    {
        int m = 16;
        double h = 0.5;
        M = build_variable_second_derivative(m, h, 2);
    }
    SparseMatrix A = M(Vector::Constant(16, 2.0));
    EXPECT_EQ(A.rows(), 16);
    EXPECT_EQ(A.cols(), 16);
    // Q^2 has -1/2 on the diagonal, so M(2) has -(1/h) * 2 * (-1/2) there
    EXPECT_NEAR(Matrix(A)(0, 0), 0.5 * 2.0 / 0.5, 1e-14);
}

TEST(VariableCoefficient, StorageIsBanded) {
    const int m = 300;
    VariableCoefficientOperator M = build_variable_second_derivative(m, 0.01, 8);
    SparseMatrix A = M(Vector::Ones(m));
    // Q has half-width 4, so M has half-width 8
    EXPECT_LE(A.nonZeros(), 17 * m);
}

TEST(VariableCoefficient, RejectsMismatchedCoefficientLength) {
    VariableCoefficientOperator M = build_variable_second_derivative(20, 0.1, 4);
    EXPECT_THROW(M(Vector::Ones(19)), std::invalid_argument);
    EXPECT_THROW(M(Vector::Ones(21)), std::invalid_argument);
}

TEST(VariableCoefficient, PropagatesBuilderErrors) {
    EXPECT_THROW(build_variable_second_derivative(20, 0.1, 5), UnsupportedOrder);
    EXPECT_THROW(build_variable_second_derivative(6, 0.1, 8), InvalidGridSize);
    EXPECT_THROW(build_variable_second_derivative(20, 0.0, 4), std::invalid_argument);
}
