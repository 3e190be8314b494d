//
// Class VirtualizationTable
//   Bilinear coarse-to-fine interpolation table. Every virtual (fine)
//   particle is reconstructed from the four coarse particles that bracket
//   its initial position:
//
//      C    D      y ^
//         .          |
//      A    B        +----> x
//
//   The table stores, per fine particle, the four corner weights and, per
//   axis, the indices of the bracketing coarse particles. It is built once
//   and read-only afterwards.
//
#ifndef QSW_VIRTUALIZATION_H
#define QSW_VIRTUALIZATION_H

#include <vector>

#include "Types/ViewTypes.h"

namespace qsw {

    template <typename T>
    class VirtualizationTable {
    public:
        using weight_view_type = grid_view_type<T>;
        using index_view_type  = line_view_type<int>;
        using coord_view_type  = line_view_type<T>;

        /*!
         * @param coarse coarse lattice (sorted, at least two points)
         * @param fine fine lattice (sorted)
         * @param coarseStep spacing of the coarse lattice
         */
        VirtualizationTable(const std::vector<T>& coarse, const std::vector<T>& fine,
                            T coarseStep);

        int fineCount() const { return nFine_m; }

        int coarseCount() const { return nCoarse_m; }

        const weight_view_type& weightA() const { return wA_m; }
        const weight_view_type& weightB() const { return wB_m; }
        const weight_view_type& weightC() const { return wC_m; }
        const weight_view_type& weightD() const { return wD_m; }

        const index_view_type& indicesPrev() const { return indicesPrev_m; }
        const index_view_type& indicesNext() const { return indicesNext_m; }

        const coord_view_type& fineLattice() const { return fineLattice_m; }

    private:
        int nCoarse_m;
        int nFine_m;

        weight_view_type wA_m, wB_m, wC_m, wD_m;
        index_view_type indicesPrev_m, indicesNext_m;
        coord_view_type fineLattice_m;
    };
}  // namespace qsw

#include "Plasma/Virtualization.hpp"

#endif
