#include "convergence_analysis.h"
#include <gsl/gsl_errno.h>
#include <gsl/gsl_fit.h>
#include <gsl/gsl_math.h>
#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace sbp {

OperatorFamily parse_family(const std::string& name) {
    if (name == "periodic") return OperatorFamily::PeriodicExplicit;
    if (name == "implicit") return OperatorFamily::PeriodicImplicit;
    if (name == "upwind") return OperatorFamily::Upwind;
    throw std::invalid_argument("Unknown operator family: " + name);
}

std::string family_name(OperatorFamily family) {
    switch (family) {
        case OperatorFamily::PeriodicExplicit: return "periodic";
        case OperatorFamily::PeriodicImplicit: return "implicit";
        case OperatorFamily::Upwind: return "upwind";
    }
    return "unknown";
}

double family_spacing(OperatorFamily family, int m, double L) {
    if (family == OperatorFamily::Upwind) {
        return L / (m - 1);
    }
    return L / m;
}

ConvergenceAnalysis::ConvergenceAnalysis(double domain_length) : L(domain_length) {
    if (!(L > 0.0)) {
        throw std::invalid_argument("Domain length must be positive");
    }
}

double ConvergenceAnalysis::measure_error(OperatorFamily family, int order, int m, bool use_dissipation) const {
    const double h = family_spacing(family, m, L);

    switch (family) {
        case OperatorFamily::PeriodicExplicit:
            return derivative_error(build_periodic_explicit(m, h, order, use_dissipation), h);
        case OperatorFamily::PeriodicImplicit:
            return derivative_error(build_periodic_implicit(m, h, use_dissipation), h);
        case OperatorFamily::Upwind: {
            UpwindOperator op = build_upwind(m, h, order);
            return derivative_error(op, h, upwind_closure(to_upwind_order(order)).block_size());
        }
    }
    throw std::invalid_argument("Unknown operator family");
}

double ConvergenceAnalysis::derivative_error(const PeriodicOperator& op, double h) const {
    FiniteDifferenceOperator D(op, h);
    const Vector& x = D.get_grid();
    const double k = 2.0 * M_PI / L;

    Vector u = (k * x).array().sin();
    Vector du_exact = k * (k * x).array().cos();

    Vector du = D.apply(u);
    return (du - du_exact).cwiseAbs().maxCoeff();
}

double ConvergenceAnalysis::derivative_error(const UpwindOperator& op, double h, int skip) const {
    const int m = static_cast<int>(op.H.rows());
    if (2 * skip >= m) {
        throw std::invalid_argument("Boundary skip leaves no interior points");
    }

    const double k = 2.0 * M_PI / L;
    Vector x = Vector::LinSpaced(m, 0.0, (m - 1) * h);
    Vector u = (k * x).array().sin();
    Vector du_exact = k * (k * x).array().cos();

    Vector err_p = op.Dp * u - du_exact;
    Vector err_m = op.Dm * u - du_exact;

    const int n = m - 2 * skip;
    double err = err_p.segment(skip, n).cwiseAbs().maxCoeff();
    return std::max(err, err_m.segment(skip, n).cwiseAbs().maxCoeff());
}

double ConvergenceAnalysis::observed_order(const std::vector<double>& h, const std::vector<double>& err) {
    if (h.size() != err.size() || h.size() < 2) {
        throw std::invalid_argument("observed_order needs at least two matching (h, err) levels");
    }

    std::vector<double> log_h(h.size()), log_err(err.size());
    for (size_t i = 0; i < h.size(); ++i) {
        if (!(h[i] > 0.0) || !(err[i] > 0.0)) {
            throw std::invalid_argument("observed_order needs positive spacings and errors");
        }
        log_h[i] = std::log(h[i]);
        log_err[i] = std::log(err[i]);
    }

    double c0, c1, cov00, cov01, cov11, sumsq;

    gsl_error_handler_t* previous = gsl_set_error_handler_off();
    int status = gsl_fit_linear(log_h.data(), 1, log_err.data(), 1, log_h.size(),
                                &c0, &c1, &cov00, &cov01, &cov11, &sumsq);
    gsl_set_error_handler(previous);

    if (status != GSL_SUCCESS) {
        throw std::runtime_error(std::string("GSL linear fit failed: ") + gsl_strerror(status));
    }

    return c1;
}

std::vector<double> ConvergenceAnalysis::pairwise_orders(const std::vector<double>& h,
                                                         const std::vector<double>& err) {
    if (h.size() != err.size()) {
        throw std::invalid_argument("pairwise_orders needs matching (h, err) levels");
    }

    std::vector<double> orders;
    for (size_t i = 0; i + 1 < h.size(); ++i) {
        orders.push_back(std::log(err[i] / err[i + 1]) / std::log(h[i] / h[i + 1]));
    }
    return orders;
}

} // namespace sbp
