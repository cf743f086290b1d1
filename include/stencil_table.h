#ifndef SBP_STENCIL_TABLE_H
#define SBP_STENCIL_TABLE_H

#include "sbp_common.h"
#include <utility>

namespace sbp {

enum class PeriodicOrder { Second = 2, Fourth = 4, Sixth = 6, Eighth = 8, Tenth = 10, Twelfth = 12 };

enum class UpwindOrder { Third = 3, Fifth = 5, Seventh = 7 };

/**
 * @brief Finite difference weights at offsets -l..r around a grid point
 *
 * The weight applied to u[i + k] is weights[k + l].
 */
struct Stencil {
    std::vector<double> weights;
    int l;
    int r;

    Stencil(std::vector<double> w, int left, int right)
        : weights(std::move(w)), l(left), r(right) {}

    int width() const { return l + r + 1; }
    double at(int k) const { return weights[k + l]; }
};

// Binomial stencil approximating an even derivative, applied as a * stencil
struct DissipationStencil {
    Stencil stencil;
    double a;

    DissipationStencil(Stencil s, double scale) : stencil(std::move(s)), a(scale) {}
};

/**
 * @brief Boundary closure of an upwind operator pair
 *
 * norm_weights holds the b leading diagonal entries of H/h. The trailing
 * entries are the same weights in reverse order. Qu is the b x b block that
 * overwrites the leading corner of Qp.
 */
struct UpwindClosure {
    std::vector<double> norm_weights;
    Stencil interior;
    Matrix Qu;

    UpwindClosure(std::vector<double> hw, Stencil s, Matrix qu)
        : norm_weights(std::move(hw)), interior(std::move(s)), Qu(std::move(qu)) {}

    int block_size() const { return static_cast<int>(norm_weights.size()); }
};

PeriodicOrder to_periodic_order(int order);
UpwindOrder to_upwind_order(int order);

// Antisymmetric interior stencil of the explicit periodic operator
Stencil periodic_stencil(PeriodicOrder order);

// Artificial dissipation matching the explicit periodic operator
DissipationStencil dissipation_stencil(PeriodicOrder order);

// Banded norm of the compact periodic scheme (half-width 5), without the h factor
Stencil implicit_norm_stencil();

// Banded difference stencil of the compact periodic scheme (half-width 5)
Stencil implicit_difference_stencil();

UpwindClosure upwind_closure(UpwindOrder order);

} // namespace sbp

#endif // SBP_STENCIL_TABLE_H
