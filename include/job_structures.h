#ifndef SBP_JOB_STRUCTURES_H
#define SBP_JOB_STRUCTURES_H

#include <string>

/**
 * @brief One operator to build and measure in a convergence study
 */
struct study_job_t {
    std::string family;   // periodic, implicit or upwind
    int order;            // Accuracy order (nominal for implicit)
    int m;                // Grid points
    double L;             // Domain length
    bool dissipation;     // Artificial dissipation (periodic families)

    study_job_t() = default;

    study_job_t(const std::string& f, int o, int points, double length, bool diss)
        : family(f), order(o), m(points), L(length), dissipation(diss) {}
};

/**
 * @brief Measured error of one grid level in a series
 */
struct result_entry {
    int m;
    double h;
    double error;

    result_entry() = default;
    result_entry(int points, double spacing, double err) : m(points), h(spacing), error(err) {}
};

#endif // SBP_JOB_STRUCTURES_H
