#include "periodic_operators.h"
#include "circulant.h"
#include <algorithm>
#include <utility>

namespace sbp {

namespace {

SparseMatrix scaled_identity(int m, double h) {
    SparseMatrix I(m, m);
    I.setIdentity();
    return h * I;
}

} // namespace

PeriodicOperator build_periodic_explicit(int m, double h, int order, bool use_dissipation) {
    return build_periodic_explicit(m, h, to_periodic_order(order), use_dissipation);
}

PeriodicOperator build_periodic_explicit(int m, double h, PeriodicOrder order, bool use_dissipation) {
    check_spacing(h);

    Stencil d = periodic_stencil(order);
    check_grid_size(m, d.l + d.r + 1);

    PeriodicOperator op;
    op.H = scaled_identity(m, h);
    op.Q = assemble_circulant(d, m);

    if (use_dissipation) {
        DissipationStencil ad = dissipation_stencil(order);
        SparseMatrix S = assemble_circulant(ad.stencil, m, ad.a);
        op.Q = op.Q - S;
    }

    return op;
}

PeriodicOperator build_periodic_implicit(int m, double h, bool use_dissipation) {
    check_spacing(h);

    Stencil hs = implicit_norm_stencil();
    Stencil qs = implicit_difference_stencil();

    // Validate every stencil up front so a failure leaves nothing half-built
    DissipationStencil ad = dissipation_stencil(PeriodicOrder::Twelfth);
    int minimum = qs.l + qs.r + 1;
    if (use_dissipation) {
        minimum = std::max(minimum, ad.stencil.l + ad.stencil.r + 1);
    }
    check_grid_size(m, minimum);

    PeriodicOperator op;
    op.H = assemble_circulant(hs, m, h);
    op.Q = assemble_circulant(qs, m);

    if (use_dissipation) {
        SparseMatrix S = assemble_circulant(ad.stencil, m, ad.a);
        op.Q = op.Q - S;
    }

    return op;
}

VariableCoefficientOperator build_variable_second_derivative(int m, double h, int order) {
    PeriodicOperator op = build_periodic_explicit(m, h, order, false);
    SparseMatrix Q = std::move(op.Q);

    return [Q, h, m](const Vector& c) -> SparseMatrix {
        if (c.size() != m) {
            throw std::invalid_argument("Coefficient vector has " + std::to_string(c.size()) +
                                        " entries, operator expects " + std::to_string(m));
        }
        SparseMatrix C(m, m);
        std::vector<Triplet> triplets;
        triplets.reserve(m);
        for (int i = 0; i < m; ++i) {
            triplets.emplace_back(i, i, c(i));
        }
        C.setFromTriplets(triplets.begin(), triplets.end());

        SparseMatrix QC = Q * C;
        SparseMatrix M = QC * Q;
        M *= -1.0 / h;
        return M;
    };
}

} // namespace sbp
