#include <gtest/gtest.h>
#include "upwind_operators.h"
#include "test_utils.h"
#include <cmath>

using namespace sbp;
using sbp_test::max_abs;

namespace {

struct UpwindCase {
    int order;
    int block;            // Boundary closure size b
    int boundary_degree;  // Highest polynomial degree differentiated exactly near the boundary
};

const UpwindCase kCases[] = {
    {3, 4, 1},
    {5, 4, 2},
    {7, 6, 3},
};

Matrix boundary_form(int m) {
    Matrix B = Matrix::Zero(m, m);
    B(0, 0) = -1.0;
    B(m - 1, m - 1) = 1.0;
    return B;
}

} // namespace

TEST(Upwind, BoundaryVectorsPickFirstAndLastPoint) {
    UpwindOperator op = build_upwind(20, 0.1, 3);
    ASSERT_EQ(op.e_l.size(), 20);
    ASSERT_EQ(op.e_r.size(), 20);
    EXPECT_EQ(op.e_l(0), 1.0);
    EXPECT_EQ(op.e_l.sum(), 1.0);
    EXPECT_EQ(op.e_r(19), 1.0);
    EXPECT_EQ(op.e_r.sum(), 1.0);
}

TEST(Upwind, NormIsDiagonalPositiveAndMirrored) {
    const double h = 0.05;
    for (const auto& c : kCases) {
        const int m = 30;
        UpwindOperator op = build_upwind(m, h, c.order);
        Matrix H = Matrix(op.H);

        EXPECT_EQ(op.H.nonZeros(), m) << "order " << c.order;
        for (int i = 0; i < m; ++i) {
            EXPECT_GT(H(i, i), 0.0);
            EXPECT_EQ(H(i, i), H(m - 1 - i, m - 1 - i));
        }
        for (int i = c.block; i < m - c.block; ++i) {
            EXPECT_EQ(H(i, i), h);
        }
        EXPECT_LT(max_abs(Matrix(Matrix(op.HI) * H - Matrix::Identity(m, m))), 1e-14) << "order " << c.order;

        // Boundary weights integrate constants exactly: sum of H equals the domain length
        EXPECT_NEAR(H.sum(), (m - 1) * h, 1e-12) << "order " << c.order;
    }
}

TEST(Upwind, MinusOperatorIsNegatedTranspose) {
    for (const auto& c : kCases) {
        UpwindOperator op = build_upwind(25, 0.1, c.order);
        Matrix Qp = Matrix(op.Qp);
        EXPECT_EQ(max_abs(Matrix(Matrix(op.Qm) + Qp.transpose())), 0.0) << "order " << c.order;
    }
}

TEST(Upwind, SummationByPartsIdentity) {
    const int m = 25;
    for (const auto& c : kCases) {
        UpwindOperator op = build_upwind(m, 0.1, c.order);
        Matrix HDp = Matrix(op.H) * Matrix(op.Dp);
        Matrix HDm = Matrix(op.H) * Matrix(op.Dm);
        EXPECT_LT(max_abs(Matrix(HDp + HDm.transpose() - boundary_form(m))), 1e-13) << "order " << c.order;
    }
}

TEST(Upwind, SymmetricPartOfQpIsNegativeSemidefinite) {
    const int m = 30;
    for (const auto& c : kCases) {
        UpwindOperator op = build_upwind(m, 0.1, c.order);
        Matrix Qp = Matrix(op.Qp);
        Matrix S = Qp + Qp.transpose();

        EXPECT_LT(max_abs(Vector(S * Vector::Ones(m))), 1e-13) << "order " << c.order;

        Eigen::SelfAdjointEigenSolver<Matrix> eig(S);
        EXPECT_LT(eig.eigenvalues().maxCoeff(), 1e-12) << "order " << c.order;
        EXPECT_LT(eig.eigenvalues().minCoeff(), -1e-3) << "order " << c.order;
    }
}

TEST(Upwind, BoundaryRowsOfQpAbsorbTheBoundaryTerm) {
    for (const auto& c : kCases) {
        const int m = 21;
        UpwindOperator op = build_upwind(m, 0.1, c.order);
        Vector row_sums = op.Qp * Vector::Ones(m);
        EXPECT_NEAR(row_sums(0), 0.5, 1e-14) << "order " << c.order;
        EXPECT_NEAR(row_sums(m - 1), -0.5, 1e-14) << "order " << c.order;
        EXPECT_LT(max_abs(Vector(row_sums.segment(1, m - 2))), 1e-14) << "order " << c.order;
    }
}

TEST(Upwind, TrailingBlockIsReversedTransposeOfLeadingBlock) {
    for (const auto& c : kCases) {
        const int m = 20;
        const int b = c.block;
        Matrix Qp = Matrix(build_upwind(m, 1.0, c.order).Qp);
        for (int i = 0; i < b; ++i) {
            for (int j = 0; j < b; ++j) {
                EXPECT_EQ(Qp(m - b + i, m - b + j), Qp(b - 1 - j, b - 1 - i));
            }
        }
    }
}

TEST(Upwind, DifferentiatesPolynomialsExactly) {
    const int m = 25;
    const double h = 0.1;
    for (const auto& c : kCases) {
        UpwindOperator op = build_upwind(m, h, c.order);
        Vector x = Vector::LinSpaced(m, 0.0, (m - 1) * h);

        for (int degree = 0; degree <= c.order; ++degree) {
            Vector u = x.array().pow(static_cast<double>(degree));
            Vector du = Vector::Zero(m);
            if (degree > 0) du = static_cast<double>(degree) * x.array().pow(static_cast<double>(degree - 1));

            Vector err_p = op.Dp * u - du;
            Vector err_m = op.Dm * u - du;

            // Interior rows are exact up to the interior order
            const int n = m - 2 * c.block;
            EXPECT_LT(max_abs(Vector(err_p.segment(c.block, n))), 1e-9)
                << "order " << c.order << " degree " << degree;
            EXPECT_LT(max_abs(Vector(err_m.segment(c.block, n))), 1e-9)
                << "order " << c.order << " degree " << degree;

            // Boundary closures are exact up to their reduced degree
            if (degree <= c.boundary_degree) {
                EXPECT_LT(max_abs(err_p), 1e-10) << "order " << c.order << " degree " << degree;
                EXPECT_LT(max_abs(err_m), 1e-10) << "order " << c.order << " degree " << degree;
            }
        }
    }
}

TEST(Upwind, AverageOfPairIsCentral) {
    const int m = 30;
    for (const auto& c : kCases) {
        UpwindOperator op = build_upwind(m, 0.1, c.order);
        Matrix Dc = 0.5 * (Matrix(op.Dp) + Matrix(op.Dm));
        Matrix HDc = Matrix(op.H) * Dc;
        // H Dc + (H Dc)^T = B, so H Dc - B/2 is skew
        Matrix skew = HDc - 0.5 * boundary_form(m);
        EXPECT_LT(max_abs(Matrix(skew + skew.transpose())), 1e-13) << "order " << c.order;
    }
}

TEST(Upwind, FixedOrderEntryPointsMatchGenericBuilder) {
    const int m = 40;
    const double h = 0.3;
    EXPECT_EQ(max_abs(Matrix(build_upwind_3rd(m, h).Dp) - Matrix(build_upwind(m, h, 3).Dp)), 0.0);
    EXPECT_EQ(max_abs(Matrix(build_upwind_5th(m, h).Dp) - Matrix(build_upwind(m, h, 5).Dp)), 0.0);
    EXPECT_EQ(max_abs(Matrix(build_upwind_7th(m, h).Dm) - Matrix(build_upwind(m, h, 7).Dm)), 0.0);
}

TEST(Upwind, StorageIsBanded) {
    const int m = 200;
    UpwindOperator op = build_upwind(m, 0.01, 7);
    EXPECT_LT(op.Dp.nonZeros(), 10 * m);
    EXPECT_LT(op.Dm.nonZeros(), 10 * m);
    EXPECT_EQ(op.HI.nonZeros(), m);
}

TEST(Upwind, RejectsUnsupportedOrder) {
    EXPECT_THROW(build_upwind(30, 0.1, 2), UnsupportedOrder);
    EXPECT_THROW(build_upwind(30, 0.1, 4), UnsupportedOrder);
    EXPECT_THROW(build_upwind(30, 0.1, 9), UnsupportedOrder);
}

TEST(Upwind, RejectsGridTooSmallForBoundaryBlocks) {
    EXPECT_THROW(build_upwind_3rd(8, 0.1), InvalidGridSize);
    EXPECT_NO_THROW(build_upwind_3rd(9, 0.1));
    EXPECT_THROW(build_upwind_5th(8, 0.1), InvalidGridSize);
    EXPECT_NO_THROW(build_upwind_5th(9, 0.1));
    EXPECT_THROW(build_upwind_7th(12, 0.1), InvalidGridSize);
    EXPECT_NO_THROW(build_upwind_7th(13, 0.1));
    EXPECT_THROW(build_upwind_7th(0, 0.1), InvalidGridSize);
}

TEST(Upwind, RejectsNonPositiveSpacing) {
    EXPECT_THROW(build_upwind(30, 0.0, 5), std::invalid_argument);
    EXPECT_THROW(build_upwind(30, -2.0, 5), std::invalid_argument);
}
