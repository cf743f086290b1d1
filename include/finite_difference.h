#ifndef SBP_FINITE_DIFFERENCE_H
#define SBP_FINITE_DIFFERENCE_H

#include "periodic_operators.h"
#include <Eigen/SparseCholesky>

namespace sbp {

/**
 * @brief Applies a first derivative D1 = H^{-1} Q on a uniform grid
 *
 * H is factored once, so banded (compact) norms are handled the same way
 * as diagonal ones. The grid is x_i = x0 + i h.
 */
class FiniteDifferenceOperator {
private:
    int N;
    double h;
    SparseMatrix norm;
    SparseMatrix difference;
    Vector xi;
    Eigen::SimplicialLDLT<SparseMatrix> norm_solver;

    void factorize_norm();

public:
    FiniteDifferenceOperator(const SparseMatrix& H, const SparseMatrix& Q, double spacing, double x0 = 0.0);
    FiniteDifferenceOperator(const PeriodicOperator& op, double spacing);

    const SparseMatrix& get_norm() const { return norm; }
    const SparseMatrix& get_difference() const { return difference; }
    const Vector& get_grid() const { return xi; }
    int size() const { return N; }
    double spacing() const { return h; }

    Vector apply(const Vector& u) const;

    // Discrete inner product u^T H v
    double inner_product(const Vector& u, const Vector& v) const;
};

} // namespace sbp

#endif // SBP_FINITE_DIFFERENCE_H
