#ifndef SBP_CONVERGENCE_ANALYSIS_H
#define SBP_CONVERGENCE_ANALYSIS_H

#include "finite_difference.h"
#include "upwind_operators.h"
#include <string>
#include <vector>

namespace sbp {

enum class OperatorFamily { PeriodicExplicit, PeriodicImplicit, Upwind };

OperatorFamily parse_family(const std::string& name);
std::string family_name(OperatorFamily family);

// Grid spacing used for a family on m points of a domain of length L
double family_spacing(OperatorFamily family, int m, double L);

class ConvergenceAnalysis {
private:
    double L;

public:
    explicit ConvergenceAnalysis(double domain_length = 1.0);

    double domain_length() const { return L; }

    /**
     * @brief Build the operator of the given family on m points and measure its error
     *
     * The implicit family ignores order. Dissipation applies to the periodic families only.
     */
    double measure_error(OperatorFamily family, int order, int m, bool use_dissipation = false) const;

    // Max error of H^{-1} Q applied to sin(2 pi x / L) on the periodic grid x_i = i h
    double derivative_error(const PeriodicOperator& op, double h) const;

    /**
     * @brief Max interior error of Dp and Dm applied to sin(2 pi x / L) on [0, L]
     *
     * Rows within `skip` points of either boundary are excluded, so only the
     * interior stencil is measured.
     */
    double derivative_error(const UpwindOperator& op, double h, int skip) const;

    /**
     * @brief Least squares slope of log(err) against log(h)
     *
     * @throws std::invalid_argument for fewer than two levels or non-positive data
     * @throws std::runtime_error if the GSL fit fails
     */
    static double observed_order(const std::vector<double>& h, const std::vector<double>& err);

    // log(e_i / e_{i+1}) / log(h_i / h_{i+1}) for each consecutive pair
    static std::vector<double> pairwise_orders(const std::vector<double>& h, const std::vector<double>& err);
};

} // namespace sbp

#endif // SBP_CONVERGENCE_ANALYSIS_H
