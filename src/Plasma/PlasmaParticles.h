//
// Class PlasmaParticles
//   The immutable part of the coarse electron ensemble: mass, charge and
//   initial position of each of the Nc x Nc coarse macro-particles.
//   Particle (i, j) starts at (coarse[i], coarse[j]). The evolving part
//   (offsets and momenta) is carried by the slice state.
//
#ifndef QSW_PLASMA_PARTICLES_H
#define QSW_PLASMA_PARTICLES_H

#include <vector>

#include "Types/ViewTypes.h"

namespace qsw {

    template <typename T>
    class PlasmaParticles {
    public:
        using attribute_view_type = grid_view_type<T>;

        /*!
         * Creates electrons on the coarse lattice. Each coarse particle
         * represents coarseness^2 cells, so mass and charge are scaled by it.
         * @param coarse coarse lattice coordinates
         * @param coarseness grid cells per coarse particle
         */
        PlasmaParticles(const std::vector<T>& coarse, int coarseness);

        /*!
         * Creates particles from explicit attribute arrays (all Nc x Nc)
         */
        PlasmaParticles(const attribute_view_type& m, const attribute_view_type& q,
                        const attribute_view_type& xInit, const attribute_view_type& yInit);

        int count() const { return m_m.extent(0); }

        const attribute_view_type& m() const { return m_m; }
        const attribute_view_type& q() const { return q_m; }
        const attribute_view_type& xInit() const { return xInit_m; }
        const attribute_view_type& yInit() const { return yInit_m; }

    private:
        attribute_view_type m_m, q_m, xInit_m, yInit_m;
    };
}  // namespace qsw

#include "Plasma/PlasmaParticles.hpp"

#endif
