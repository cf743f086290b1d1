#include "upwind_operators.h"

namespace sbp {

namespace {

// Qp from the interior stencil, with the b x b corner blocks taken from Qu.
// The trailing block is Qu flipped along both axes and transposed.
SparseMatrix assemble_upwind_difference(const UpwindClosure& closure, int m) {
    const int b = closure.block_size();
    const Stencil& d = closure.interior;
    const Matrix& Qu = closure.Qu;

    std::vector<Triplet> triplets;
    triplets.reserve(static_cast<size_t>(m) * d.width() + 2 * b * b);

    for (int i = 0; i < m; ++i) {
        for (int k = -d.l; k <= d.r; ++k) {
            int j = i + k;
            if (j < 0 || j >= m) continue;
            bool leading_block = i < b && j < b;
            bool trailing_block = i >= m - b && j >= m - b;
            if (leading_block || trailing_block) continue;
            triplets.emplace_back(i, j, d.at(k));
        }
    }

    for (int i = 0; i < b; ++i) {
        for (int j = 0; j < b; ++j) {
            triplets.emplace_back(i, j, Qu(i, j));
            triplets.emplace_back(m - b + i, m - b + j, Qu(b - 1 - j, b - 1 - i));
        }
    }

    SparseMatrix Qp(m, m);
    Qp.setFromTriplets(triplets.begin(), triplets.end());
    return Qp;
}

} // namespace

UpwindOperator build_upwind(int m, double h, int order) {
    return build_upwind(m, h, to_upwind_order(order));
}

UpwindOperator build_upwind(int m, double h, UpwindOrder order) {
    check_spacing(h);

    UpwindClosure closure = upwind_closure(order);
    const int b = closure.block_size();
    check_grid_size(m, 2 * b + 1);

    UpwindOperator op;

    op.e_l = Vector::Zero(m);
    op.e_l(0) = 1.0;
    op.e_r = Vector::Zero(m);
    op.e_r(m - 1) = 1.0;

    Vector norm = Vector::Constant(m, h);
    for (int i = 0; i < b; ++i) {
        norm(i) = h * closure.norm_weights[i];
        norm(m - 1 - i) = h * closure.norm_weights[i];
    }
    op.H.resize(m, m);
    op.HI.resize(m, m);
    std::vector<Triplet> h_triplets, hi_triplets;
    h_triplets.reserve(m);
    hi_triplets.reserve(m);
    for (int i = 0; i < m; ++i) {
        h_triplets.emplace_back(i, i, norm(i));
        hi_triplets.emplace_back(i, i, 1.0 / norm(i));
    }
    op.H.setFromTriplets(h_triplets.begin(), h_triplets.end());
    op.HI.setFromTriplets(hi_triplets.begin(), hi_triplets.end());

    op.Qp = assemble_upwind_difference(closure, m);
    op.Qm = -SparseMatrix(op.Qp.transpose());

    // B/2 with B = e_r e_r^T - e_l e_l^T
    SparseMatrix half_boundary(m, m);
    std::vector<Triplet> b_triplets = {Triplet(0, 0, -0.5), Triplet(m - 1, m - 1, 0.5)};
    half_boundary.setFromTriplets(b_triplets.begin(), b_triplets.end());

    SparseMatrix Qp_b = op.Qp + half_boundary;
    SparseMatrix Qm_b = op.Qm + half_boundary;
    op.Dp = op.HI * Qp_b;
    op.Dm = op.HI * Qm_b;

    return op;
}

UpwindOperator build_upwind_3rd(int m, double h) {
    return build_upwind(m, h, UpwindOrder::Third);
}

UpwindOperator build_upwind_5th(int m, double h) {
    return build_upwind(m, h, UpwindOrder::Fifth);
}

UpwindOperator build_upwind_7th(int m, double h) {
    return build_upwind(m, h, UpwindOrder::Seventh);
}

} // namespace sbp
