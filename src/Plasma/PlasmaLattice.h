//
// PlasmaLattice
//   One dimensional initial positions of the plasma macro-particles. The
//   coarse lattice holds the particles that are actually advanced, the fine
//   lattice the virtual particles that are interpolated from them when
//   depositing. Both are symmetric about zero; the 2D lattices are the
//   outer products of these with themselves.
//
#ifndef QSW_PLASMA_LATTICE_H
#define QSW_PLASMA_LATTICE_H

#include <vector>

namespace qsw {

    /*!
     * Coarse lattice: spacing h * coarseness, one particle on the axis.
     * @param steps number of grid cells covered by plasma
     * @param h grid step size
     * @param coarseness grid cells per coarse particle
     * @return the sorted lattice coordinates
     */
    template <typename T>
    std::vector<T> makeCoarseLattice(int steps, T h, int coarseness);

    /*!
     * Fine lattice: spacing h / fineness. For odd fineness particles sit on
     * the axis, for even fineness they are shifted by half a spacing, so that
     * no particle ever sits on a cell corner.
     * @param steps number of grid cells covered by plasma
     * @param h grid step size
     * @param fineness virtual particles per cell
     * @return the sorted lattice coordinates
     */
    template <typename T>
    std::vector<T> makeFineLattice(int steps, T h, int fineness);
}  // namespace qsw

#include "Plasma/PlasmaLattice.hpp"

#endif
