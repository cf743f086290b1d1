#ifndef SBP_UPWIND_OPERATORS_H
#define SBP_UPWIND_OPERATORS_H

#include "stencil_table.h"

namespace sbp {

/**
 * @brief Upwind SBP operator pair of order 3, 5 or 7 on a non-periodic grid
 *
 * Qp is the tabulated difference matrix before the boundary terms are added
 * and Qm = -Qp^T. The pair satisfies
 *   Dp = HI (Qp - e_l e_l^T / 2 + e_r e_r^T / 2)
 *   Dm = HI (Qm - e_l e_l^T / 2 + e_r e_r^T / 2)
 * so that H Dp + (H Dm)^T = e_r e_r^T - e_l e_l^T.
 */
struct UpwindOperator {
    SparseMatrix H;
    SparseMatrix HI;
    SparseMatrix Qp;
    SparseMatrix Qm;
    SparseMatrix Dp;
    SparseMatrix Dm;
    Vector e_l;
    Vector e_r;
};

/**
 * @brief Build the upwind operator pair of the given order
 *
 * @throws UnsupportedOrder for an order outside {3,5,7}
 * @throws InvalidGridSize if m <= 2b, with b the boundary block size (4, 4, 6)
 * @throws std::invalid_argument if h is not positive
 */
UpwindOperator build_upwind(int m, double h, int order);
UpwindOperator build_upwind(int m, double h, UpwindOrder order);

UpwindOperator build_upwind_3rd(int m, double h);
UpwindOperator build_upwind_5th(int m, double h);
UpwindOperator build_upwind_7th(int m, double h);

} // namespace sbp

#endif // SBP_UPWIND_OPERATORS_H
