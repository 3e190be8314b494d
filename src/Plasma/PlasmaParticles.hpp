//
// Class PlasmaParticles
//   The immutable part of the coarse electron ensemble.
//
#include <initializer_list>

#include "Types/QswTypes.h"

#include "Utility/QswException.h"

namespace qsw {

    template <typename T>
    PlasmaParticles<T>::PlasmaParticles(const std::vector<T>& coarse, int coarseness) {
        const int nc   = coarse.size();
        const T weight = T(coarseness) * T(coarseness);

        m_m     = attribute_view_type("pl_m", nc, nc);
        q_m     = attribute_view_type("pl_q", nc, nc);
        xInit_m = attribute_view_type("pl_x_init", nc, nc);
        yInit_m = attribute_view_type("pl_y_init", nc, nc);

        auto hx = Kokkos::create_mirror_view(xInit_m);
        auto hy = Kokkos::create_mirror_view(yInit_m);
        for (int i = 0; i < nc; ++i) {
            for (int j = 0; j < nc; ++j) {
                hx(i, j) = coarse[i];
                hy(i, j) = coarse[j];
            }
        }
        Kokkos::deep_copy(xInit_m, hx);
        Kokkos::deep_copy(yInit_m, hy);

        Kokkos::deep_copy(m_m, T(ELECTRON_MASS) * weight);
        Kokkos::deep_copy(q_m, T(ELECTRON_CHARGE) * weight);
    }

    template <typename T>
    PlasmaParticles<T>::PlasmaParticles(const attribute_view_type& m,
                                        const attribute_view_type& q,
                                        const attribute_view_type& xInit,
                                        const attribute_view_type& yInit)
        : m_m(m)
        , q_m(q)
        , xInit_m(xInit)
        , yInit_m(yInit) {
        const size_t nc = m.extent(0);
        for (const auto* v : {&m, &q, &xInit, &yInit}) {
            if (v->extent(0) != nc || v->extent(1) != nc) {
                throw QswException("PlasmaParticles::PlasmaParticles()",
                                   "Particle attribute arrays must all be Nc x Nc.");
            }
        }
    }
}  // namespace qsw
