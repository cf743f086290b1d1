#ifndef SBP_COMMON_H
#define SBP_COMMON_H

#include <Eigen/Dense>
#include <Eigen/Sparse>
#include <stdexcept>
#include <string>
#include <vector>

namespace sbp {

using Vector = Eigen::VectorXd;
using Matrix = Eigen::MatrixXd;
using SparseMatrix = Eigen::SparseMatrix<double>;
using Triplet = Eigen::Triplet<double>;

// Order is not among the accuracy orders tabulated for the operator family
class UnsupportedOrder : public std::invalid_argument {
public:
    UnsupportedOrder(const std::string& family, int order)
        : std::invalid_argument("Unsupported " + family + " order: " + std::to_string(order)),
          order_(order) {}

    int order() const { return order_; }

private:
    int order_;
};

// Grid too small for the stencil or boundary closure to fit without overlap
class InvalidGridSize : public std::invalid_argument {
public:
    InvalidGridSize(int m, int minimum)
        : std::invalid_argument("Invalid grid size m=" + std::to_string(m) +
                                ", operator requires m >= " + std::to_string(minimum)),
          m_(m), minimum_(minimum) {}

    int m() const { return m_; }
    int minimum() const { return minimum_; }

private:
    int m_;
    int minimum_;
};

// Throws std::invalid_argument unless h is positive and finite.
void check_spacing(double h);

// Throws InvalidGridSize unless m >= minimum.
void check_grid_size(int m, int minimum);

} // namespace sbp

#endif // SBP_COMMON_H
