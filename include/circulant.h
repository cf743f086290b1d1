#ifndef SBP_CIRCULANT_H
#define SBP_CIRCULANT_H

#include "stencil_table.h"

namespace sbp {

/**
 * @brief Assemble the m x m periodic matrix of a centered stencil
 *
 * Row i holds the stencil centered at i with column indices wrapped
 * modulo m, every weight multiplied by scale. Exact zeros are not stored.
 *
 * @throws InvalidGridSize if m <= l + r, where wrapped and interior weights would overlap
 */
SparseMatrix assemble_circulant(const Stencil& stencil, int m, double scale = 1.0);

} // namespace sbp

#endif // SBP_CIRCULANT_H
