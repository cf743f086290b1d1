#include "stencil_table.h"

namespace sbp {

PeriodicOrder to_periodic_order(int order) {
    switch (order) {
        case 2:  return PeriodicOrder::Second;
        case 4:  return PeriodicOrder::Fourth;
        case 6:  return PeriodicOrder::Sixth;
        case 8:  return PeriodicOrder::Eighth;
        case 10: return PeriodicOrder::Tenth;
        case 12: return PeriodicOrder::Twelfth;
        default:
            throw UnsupportedOrder("periodic", order);
    }
}

UpwindOrder to_upwind_order(int order) {
    switch (order) {
        case 3: return UpwindOrder::Third;
        case 5: return UpwindOrder::Fifth;
        case 7: return UpwindOrder::Seventh;
        default:
            throw UnsupportedOrder("upwind", order);
    }
}

Stencil periodic_stencil(PeriodicOrder order) {
    switch (order) {
        case PeriodicOrder::Second:
            return Stencil({-0.5, 0.0, 0.5}, 1, 1);
        case PeriodicOrder::Fourth:
            return Stencil({1.0/12.0, -2.0/3.0, 0.0, 2.0/3.0, -1.0/12.0}, 2, 2);
        case PeriodicOrder::Sixth:
            return Stencil({-1.0/60.0, 3.0/20.0, -3.0/4.0, 0.0,
                            3.0/4.0, -3.0/20.0, 1.0/60.0}, 3, 3);
        case PeriodicOrder::Eighth:
            return Stencil({1.0/280.0, -4.0/105.0, 1.0/5.0, -4.0/5.0, 0.0,
                            4.0/5.0, -1.0/5.0, 4.0/105.0, -1.0/280.0}, 4, 4);
        case PeriodicOrder::Tenth:
            return Stencil({-1.0/1260.0, 5.0/504.0, -5.0/84.0, 5.0/21.0, -5.0/6.0, 0.0,
                            5.0/6.0, -5.0/21.0, 5.0/84.0, -5.0/504.0, 1.0/1260.0}, 5, 5);
        case PeriodicOrder::Twelfth:
            return Stencil({1.0/5544.0, -1.0/385.0, 1.0/56.0, -5.0/63.0, 15.0/56.0, -6.0/7.0, 0.0,
                            6.0/7.0, -15.0/56.0, 5.0/63.0, -1.0/56.0, 1.0/385.0, -1.0/5544.0}, 6, 6);
    }
    throw UnsupportedOrder("periodic", static_cast<int>(order));
}

// The sign alternates with the order so that Q - S always has a positive
// semidefinite symmetric part.
DissipationStencil dissipation_stencil(PeriodicOrder order) {
    switch (order) {
        case PeriodicOrder::Second:
            return DissipationStencil(Stencil({1, -2, 1}, 1, 1), 1.0/2.0);
        case PeriodicOrder::Fourth:
            return DissipationStencil(Stencil({-1, 4, -6, 4, -1}, 2, 2), 1.0/12.0);
        case PeriodicOrder::Sixth:
            return DissipationStencil(Stencil({1, -6, 15, -20, 15, -6, 1}, 3, 3), 1.0/60.0);
        case PeriodicOrder::Eighth:
            return DissipationStencil(Stencil({-1, 8, -28, 56, -70, 56, -28, 8, -1}, 4, 4), 1.0/280.0);
        case PeriodicOrder::Tenth:
            return DissipationStencil(Stencil({1, -10, 45, -120, 210, -252, 210, -120, 45, -10, 1}, 5, 5),
                                      1.0/1260.0);
        case PeriodicOrder::Twelfth:
            return DissipationStencil(Stencil({-1, 12, -66, 220, -495, 792, -924, 792, -495, 220, -66, 12, -1},
                                              6, 6),
                                      1.0/5544.0);
    }
    throw UnsupportedOrder("periodic", static_cast<int>(order));
}

Stencil implicit_norm_stencil() {
    const double h0 = 4203267613564094932432577824954.0 / 7049220443079284250976145948443.0;
    const double h1 = 22618790744689935699264926210401.0 / 84590645316951411011713751381316.0;
    const double h2 = -2209778222820418388602425303685.0 / 42295322658475705505856875690658.0;
    const double h3 = -1581945765.0 / 75409415044.0;
    const double h4 = 228992488.0 / 33235651987.0;
    const double h5 = 27214243.0 / 33751459947.0;

    return Stencil({h5, h4, h3, h2, h1, h0, h1, h2, h3, h4, h5}, 5, 5);
}

Stencil implicit_difference_stencil() {
    const double q1 = 9607266784889201296177.0 / 19560081711822931675052.0;
    const double q2 = 8866705546306148289391.0 / 97800408559114658375260.0;
    const double q3 = -19659090145677941034997.0 / 293401225677343975125780.0;
    const double q4 = 127051314.0 / 37983174851.0;
    const double q5 = 389910724.0 / 128741750713.0;

    return Stencil({-q5, -q4, -q3, -q2, -q1, 0.0, q1, q2, q3, q4, q5}, 5, 5);
}

UpwindClosure upwind_closure(UpwindOrder order) {
    switch (order) {
        case UpwindOrder::Third: {
            std::vector<double> hw = {
                0.4347899357e10 / 0.12695947216e11,
                0.12032349023e11 / 0.9521960412e10,
                0.32831414215e11 / 0.38087841648e11,
                0.6550489565e10 / 0.6347973608e10
            };
            Stencil interior({-1.0/3.0, -1.0/2.0, 1.0, -1.0/6.0}, 1, 2);

            Matrix Qu(4, 4);
            Qu << -0.847e3 / 0.37560e5, 0.79604458492699e14 / 0.119214944358240e15,
                  -0.1643521867663e13 / 0.14901868044780e14, -0.4160444549287e13 / 0.119214944358240e15,
                  -0.22671019561497e14 / 0.39738314786080e14, -0.6023e4 / 0.37560e5,
                  0.91628011326497e14 / 0.119214944358240e15, -0.749671686919e12 / 0.19869157393040e14,
                  0.63495586071e11 / 0.1241822337065e13, -0.16644840223051e14 / 0.39738314786080e14,
                  -0.4311e4 / 0.12520e5, 0.104757273135509e15 / 0.119214944358240e15,
                  0.4998377065543e13 / 0.119214944358240e15, -0.5276507651527e13 / 0.59607472179120e14,
                  -0.12476888349687e14 / 0.39738314786080e14, -0.5919e4 / 0.12520e5;

            return UpwindClosure(hw, interior, Qu);
        }
        case UpwindOrder::Fifth: {
            std::vector<double> hw = {
                0.251e3 / 0.720e3,
                0.299e3 / 0.240e3,
                0.211e3 / 0.240e3,
                0.739e3 / 0.720e3
            };
            Stencil interior({1.0/20.0, -1.0/2.0, -1.0/3.0, 1.0, -1.0/4.0, 1.0/30.0}, 2, 3);

            Matrix Qu(4, 4);
            Qu << -0.1e1 / 0.120e3, 0.941e3 / 0.1440e4, -0.47e2 / 0.360e3, -0.7e1 / 0.480e3,
                  -0.869e3 / 0.1440e4, -0.11e2 / 0.120e3, 0.25e2 / 0.32e2, -0.43e2 / 0.360e3,
                  0.29e2 / 0.360e3, -0.17e2 / 0.32e2, -0.29e2 / 0.120e3, 0.1309e4 / 0.1440e4,
                  0.1e1 / 0.32e2, -0.11e2 / 0.360e3, -0.661e3 / 0.1440e4, -0.13e2 / 0.40e2;

            return UpwindClosure(hw, interior, Qu);
        }
        case UpwindOrder::Seventh: {
            std::vector<double> hw = {
                0.19087e5 / 0.60480e5,
                0.84199e5 / 0.60480e5,
                0.18869e5 / 0.30240e5,
                0.37621e5 / 0.30240e5,
                0.55031e5 / 0.60480e5,
                0.61343e5 / 0.60480e5
            };
            Stencil interior({-1.0/105.0, 1.0/10.0, -3.0/5.0, -1.0/4.0,
                              1.0, -3.0/10.0, 1.0/15.0, -1.0/140.0}, 3, 4);

            Matrix Qu(6, 6);
            Qu << -0.265e3 / 0.300272e6, 0.1587945773e10 / 0.2432203200e10,
                  -0.1926361e7 / 0.25737600e8, -0.84398989e8 / 0.810734400e9,
                  0.48781961e8 / 0.4864406400e10, 0.3429119e7 / 0.202683600e9,

                  -0.1570125773e10 / 0.2432203200e10, -0.26517e5 / 0.1501360e7,
                  0.240029831e9 / 0.486440640e9, 0.202934303e9 / 0.972881280e9,
                  0.118207e6 / 0.13512240e8, -0.231357719e9 / 0.4864406400e10,

                  0.1626361e7 / 0.25737600e8, -0.206937767e9 / 0.486440640e9,
                  -0.61067e5 / 0.750680e6, 0.49602727e8 / 0.81073440e8,
                  -0.43783933e8 / 0.194576256e9, 0.51815011e8 / 0.810734400e9,

                  0.91418989e8 / 0.810734400e9, -0.53314099e8 / 0.194576256e9,
                  -0.33094279e8 / 0.81073440e8, -0.18269e5 / 0.107240e6,
                  0.440626231e9 / 0.486440640e9, -0.365711063e9 / 0.1621468800e10,

                  -0.62551961e8 / 0.4864406400e10, 0.799e3 / 0.35280e5,
                  0.82588241e8 / 0.972881280e9, -0.279245719e9 / 0.486440640e9,
                  -0.346583e6 / 0.1501360e7, 0.2312302333e10 / 0.2432203200e10,

                  -0.3375119e7 / 0.202683600e9, 0.202087559e9 / 0.4864406400e10,
                  -0.11297731e8 / 0.810734400e9, 0.61008503e8 / 0.1621468800e10,
                  -0.1360092253e10 / 0.2432203200e10, -0.10677e5 / 0.42896e5;

            return UpwindClosure(hw, interior, Qu);
        }
    }
    throw UnsupportedOrder("upwind", static_cast<int>(order));
}

} // namespace sbp
