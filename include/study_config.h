#ifndef SBP_STUDY_CONFIG_H
#define SBP_STUDY_CONFIG_H

#include <string>
#include <vector>

struct study_config {
    // Operator parameters
    std::string family = "periodic";
    std::vector<int> orders = {2, 4, 6, 8, 10, 12};
    bool dissipation = false;

    // Grid parameters
    double L = 1.0;                 // Domain length
    int m_min = 16;                 // Coarsest grid
    int levels = 4;                 // Grid sizes in the sequence, each halving h
    std::vector<int> grid_sizes;    // Derived in finalize()

    // Actor system parameters
    int actor_number = 4;           // Number of worker actors

    static study_config create_periodic_config(bool dissipation = false) {
        study_config conf;
        conf.family = "periodic";
        conf.orders = {2, 4, 6, 8, 10, 12};
        conf.dissipation = dissipation;
        conf.m_min = 16;            // Orders 10 and 12 reach round-off near m = 64
        conf.levels = 3;
        conf.actor_number = 4;
        return conf;
    }

    static study_config create_implicit_config(bool dissipation = false) {
        study_config conf;
        conf.family = "implicit";
        conf.orders = {10};         // Nominal, the compact scheme has a single fixed order
        conf.dissipation = dissipation;
        conf.m_min = 16;
        conf.levels = 4;
        conf.actor_number = 4;
        return conf;
    }

    static study_config create_upwind_config() {
        study_config conf;
        conf.family = "upwind";
        conf.orders = {3, 5, 7};
        conf.dissipation = false;
        conf.m_min = 33;            // h = L/32 on the coarsest grid
        conf.levels = 4;
        conf.actor_number = 4;
        return conf;
    }

    static study_config create(const std::string& family, bool dissipation) {
        if (family == "implicit") return create_implicit_config(dissipation);
        if (family == "upwind") return create_upwind_config();
        return create_periodic_config(dissipation);
    }

    // Periodic grids double m, upwind grids double m - 1, so h halves at every level
    void finalize() {
        grid_sizes.clear();
        int m = m_min;
        for (int level = 0; level < levels; ++level) {
            grid_sizes.push_back(m);
            m = (family == "upwind") ? 2 * (m - 1) + 1 : 2 * m;
        }
    }
};

#endif // SBP_STUDY_CONFIG_H
