#include "finite_difference.h"

namespace sbp {

FiniteDifferenceOperator::FiniteDifferenceOperator(const SparseMatrix& H, const SparseMatrix& Q,
                                                   double spacing, double x0)
    : N(static_cast<int>(H.rows())), h(spacing), norm(H), difference(Q) {

    check_spacing(h);
    if (H.rows() != H.cols() || Q.rows() != H.rows() || Q.cols() != H.cols()) {
        throw std::invalid_argument("H and Q must be square matrices of the same size");
    }

    xi = Vector::LinSpaced(N, x0, x0 + (N - 1) * h);

    factorize_norm();
}

FiniteDifferenceOperator::FiniteDifferenceOperator(const PeriodicOperator& op, double spacing)
    : FiniteDifferenceOperator(op.H, op.Q, spacing) {}

void FiniteDifferenceOperator::factorize_norm() {
    norm_solver.compute(norm);
    if (norm_solver.info() != Eigen::Success) {
        throw std::runtime_error("Failed to factorize norm matrix H");
    }
}

Vector FiniteDifferenceOperator::apply(const Vector& u) const {
    if (u.size() != N) {
        throw std::invalid_argument("Size mismatch between u and operator in apply");
    }
    Vector Qu = difference * u;
    Vector du = norm_solver.solve(Qu);
    if (norm_solver.info() != Eigen::Success) {
        throw std::runtime_error("Failed to solve with norm matrix H");
    }
    return du;
}

double FiniteDifferenceOperator::inner_product(const Vector& u, const Vector& v) const {
    if (u.size() != N || v.size() != N) {
        throw std::invalid_argument("Size mismatch in inner_product");
    }
    return u.dot(norm * v);
}

} // namespace sbp
