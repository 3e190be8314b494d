//
// Class GridGeometry
//   The transverse N x N grid of a slice: node count (odd, so that a node
//   sits on the axis), node spacing and the position of the reflecting walls.
//   Node k of an axis lies at (k - N / 2) * h.
//
#ifndef QSW_GRID_GEOMETRY_H
#define QSW_GRID_GEOMETRY_H

#include <Kokkos_Core.hpp>

#include <vector>

#include "Utility/QswException.h"

namespace qsw {

    template <typename T>
    class GridGeometry {
    public:
        GridGeometry(int gridSteps, T gridStepSize, int reflectPaddingSteps)
            : n_m(gridSteps)
            , h_m(gridStepSize)
            , reflectBoundary_m(gridStepSize * (T(gridSteps) / 2 - reflectPaddingSteps)) {
            if (gridSteps < 3 || gridSteps % 2 != 1) {
                throw QswException("GridGeometry::GridGeometry()",
                                   "The number of grid nodes must be odd.");
            }
        }

        KOKKOS_INLINE_FUNCTION int size() const { return n_m; }

        KOKKOS_INLINE_FUNCTION T stepSize() const { return h_m; }

        KOKKOS_INLINE_FUNCTION T reflectBoundary() const { return reflectBoundary_m; }

        // index of the node nearest to position x
        KOKKOS_INLINE_FUNCTION int nearestIndex(T x) const {
            return static_cast<int>(Kokkos::floor(x / h_m + T(0.5))) + n_m / 2;
        }

        KOKKOS_INLINE_FUNCTION T coordinate(int k) const { return (k - n_m / 2) * h_m; }

        std::vector<T> coordinates() const {
            std::vector<T> xs(n_m);
            for (int k = 0; k < n_m; ++k) {
                xs[k] = coordinate(k);
            }
            return xs;
        }

    private:
        int n_m;
        T h_m;
        T reflectBoundary_m;
    };
}  // namespace qsw

#endif
