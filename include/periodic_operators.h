#ifndef SBP_PERIODIC_OPERATORS_H
#define SBP_PERIODIC_OPERATORS_H

#include "stencil_table.h"
#include <functional>

namespace sbp {

/**
 * @brief Periodic SBP first derivative D1 = H^{-1} Q
 *
 * Without artificial dissipation Q is skew-symmetric. With dissipation the
 * symmetric part of Q is positive semidefinite.
 */
struct PeriodicOperator {
    SparseMatrix H;
    SparseMatrix Q;
};

// Maps a coefficient vector c (one entry per node) to M(c) = -(1/h) Q diag(c) Q
using VariableCoefficientOperator = std::function<SparseMatrix(const Vector&)>;

/**
 * @brief Explicit central periodic operator of order 2, 4, 6, 8, 10 or 12
 *
 * H = h I and Q is the circulant of the central stencil. When use_dissipation
 * is set, the scaled binomial stencil of the same order is subtracted from Q.
 *
 * @throws UnsupportedOrder for an order outside {2,4,6,8,10,12}
 * @throws InvalidGridSize if m <= order
 * @throws std::invalid_argument if h is not positive
 */
PeriodicOperator build_periodic_explicit(int m, double h, int order, bool use_dissipation = false);
PeriodicOperator build_periodic_explicit(int m, double h, PeriodicOrder order, bool use_dissipation = false);

/**
 * @brief Compact periodic operator with banded H and Q (half-width 5)
 *
 * Dissipation uses the twelfth order binomial stencil and so needs m > 12.
 */
PeriodicOperator build_periodic_implicit(int m, double h, bool use_dissipation = false);

/**
 * @brief Variable coefficient second derivative d/dx(c du/dx) built from the explicit Q
 *
 * The returned closure owns its copy of Q. It throws std::invalid_argument
 * when c does not have m entries.
 */
VariableCoefficientOperator build_variable_second_derivative(int m, double h, int order);

} // namespace sbp

#endif // SBP_PERIODIC_OPERATORS_H
