#ifndef SBP_CONFIG_H
#define SBP_CONFIG_H

#include "caf/all.hpp"
#include <string>

class config : public caf::actor_system_config
{
public:
    std::string family = "periodic";
    bool dissipation = false;
    int m_min = 0;                 // 0 keeps the family default
    int levels = 0;                // 0 keeps the family default
    int workers = 0;               // 0 keeps the family default
    double length = 1.0;
    config()
    {
        opt_group{custom_options_, "global"}
            .add(family, "family,f", "operator family: periodic, implicit or upwind")
            .add(dissipation, "dissipation,d", "add artificial dissipation (periodic families)")
            .add(m_min, "m-min,m", "coarsest grid size")
            .add(levels, "levels,l", "number of grid refinements")
            .add(workers, "workers,w", "number of worker actors")
            .add(length, "length,L", "domain length");
    }
};

#endif // SBP_CONFIG_H
