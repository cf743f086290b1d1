#include "sbp_common.h"
#include <cmath>

namespace sbp {

void check_spacing(double h) {
    if (!(h > 0.0) || !std::isfinite(h)) {
        throw std::invalid_argument("Grid spacing h must be positive and finite, got " + std::to_string(h));
    }
}

void check_grid_size(int m, int minimum) {
    if (m < minimum) {
        throw InvalidGridSize(m, minimum);
    }
}

} // namespace sbp
