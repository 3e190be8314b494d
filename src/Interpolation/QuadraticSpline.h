//
// QuadraticSpline
//   Second order (quadratic B-spline) grid interpolation on the transverse
//   grid. A particle at (x, y) touches the 3 x 3 nodes around its nearest
//   node (i, j); the 1D weights in terms of the offset d from that node,
//   measured in cells, are
//      w(-1) = (1/2 - d)^2 / 2,   w(0) = 3/4 - d^2,   w(+1) = (1/2 + d)^2 / 2
//   and the 2D weights are products of the 1D ones. Scatter and gather use
//   the same stencil, so that they are adjoint to each other.
//
#ifndef QSW_QUADRATIC_SPLINE_H
#define QSW_QUADRATIC_SPLINE_H

#include <Kokkos_Core.hpp>

#include <utility>

namespace qsw {
    namespace detail {
        /*!
         * Nearest node and the 3 + 3 axial weights of one particle
         * @tparam T floating point type
         */
        template <typename T>
        struct SplineStencil {
            int i, j;
            // weights of nodes i - 1, i, i + 1 (and j - 1, j, j + 1)
            T wx[3], wy[3];
        };

        /*!
         * Computes the stencil of a particle
         * @param x particle x coordinate
         * @param y particle y coordinate
         * @param gridSteps number of grid nodes per axis
         * @param h grid step size
         * @return nearest node indices and axial weights
         */
        template <typename T>
        KOKKOS_INLINE_FUNCTION SplineStencil<T> splineStencil(T x, T y, int gridSteps, T h);

        /*!
         * Scatters to a field at a single stencil point
         * @tparam Point index of the stencil point (0 ... 8, x varies fastest)
         */
        template <unsigned long Point, typename View, typename T>
        KOKKOS_INLINE_FUNCTION void scatterToPoint(const View& view,
                                                   const SplineStencil<T>& stencil, T val);

        /*!
         * Scatters a particle quantity to the 3 x 3 neighborhood with atomic
         * additions (other particles may be scattering to the same nodes)
         * @param view the field view on which to scatter
         * @param stencil the particle stencil
         * @param val the value to distribute
         */
        template <unsigned long... Point, typename View, typename T>
        KOKKOS_INLINE_FUNCTION void scatterToField(const std::index_sequence<Point...>&,
                                                   const View& view,
                                                   const SplineStencil<T>& stencil, T val);

        /*!
         * Weighted value of a field at a single stencil point
         */
        template <unsigned long Point, typename View, typename T>
        KOKKOS_INLINE_FUNCTION typename View::value_type gatherFromPoint(
            const View& view, const SplineStencil<T>& stencil);

        /*!
         * Interpolates a field at the particle position
         * @param view the field view from which to gather
         * @param stencil the particle stencil
         * @return the interpolated value
         */
        template <unsigned long... Point, typename View, typename T>
        KOKKOS_INLINE_FUNCTION typename View::value_type gatherFromField(
            const std::index_sequence<Point...>&, const View& view,
            const SplineStencil<T>& stencil);
    }  // namespace detail
}  // namespace qsw

#include "Interpolation/QuadraticSpline.hpp"

#endif
