#include "circulant.h"
#include <utility>

namespace sbp {

SparseMatrix assemble_circulant(const Stencil& stencil, int m, double scale) {
    check_grid_size(m, stencil.l + stencil.r + 1);

    // First row of the circulant: offsets 0..r at the front, -l..-1 wrapped to the tail
    std::vector<std::pair<int, double>> first_row;
    first_row.reserve(stencil.width());
    for (int k = 0; k <= stencil.r; ++k) {
        first_row.emplace_back(k, stencil.at(k));
    }
    for (int k = 1; k <= stencil.l; ++k) {
        first_row.emplace_back(m - k, stencil.at(-k));
    }

    std::vector<Triplet> triplets;
    triplets.reserve(static_cast<size_t>(m) * first_row.size());

    // Row i is the first row cyclically shifted by i
    for (int i = 0; i < m; ++i) {
        for (const auto& [position, weight] : first_row) {
            if (weight == 0.0) continue;
            int j = (position + i) % m;
            triplets.emplace_back(i, j, scale * weight);
        }
    }

    SparseMatrix A(m, m);
    A.setFromTriplets(triplets.begin(), triplets.end());
    return A;
}

} // namespace sbp
