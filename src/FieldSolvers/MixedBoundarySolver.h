//
// Class MixedBoundarySolver
//   Solves the screened Poisson equation
//      -laplace(u) + s * u = rhs
//   on the N x N transverse grid with the five point Laplacian. Along one
//   axis (the sweep axis) u vanishes on both boundary nodes, along the other
//   axis (the transform axis) the boundary is reflecting. The solution is
//   computed by a DCT-I along the transform axis, a Thomas sweep per cosine
//   mode along the sweep axis and a second DCT-I back.
//
//   Ey and Bx are solved with the sweep along x, Ex and By with the sweep
//   along y.
//
#ifndef QSW_MIXED_BOUNDARY_SOLVER_H
#define QSW_MIXED_BOUNDARY_SOLVER_H

#include "Types/ViewTypes.h"

#include "FFT/BatchedRealFFT.h"

namespace qsw {

    // the axis along which the solution vanishes on both boundary nodes
    enum class SweepAxis {
        X,
        Y
    };

    template <typename T>
    class MixedBoundarySolver {
    public:
        using field_view_type   = grid_view_type<T>;
        using buffer_view_type  = grid_view_type<T>;
        using spectrum_view_type = complex_grid_view_type<T>;

        /*!
         * @param gridSteps number of grid nodes per axis (N)
         * @param h grid step size
         * @param s weight of the screening term (>= 0)
         */
        MixedBoundarySolver(int gridSteps, T h, T s);

        /*!
         * Solves for one field
         * @param rhs right hand side on the full grid
         * @param out solution on the full grid (may not alias rhs)
         * @param axis the axis along which the boundary values are zero
         */
        void solve(const field_view_type& rhs, const field_view_type& out, SweepAxis axis);

        T screening() const { return s_m; }

    private:
        int n_m;
        T h_m;
        T s_m;

        // compensates h^2 of the Laplacian and 2 (N - 1) of the DCT-I pair
        T mul_m;

        BatchedRealFFT<T> fft_m;

        // rows are indexed by the sweep coordinate; input rows are even
        // extensions of length 2N - 2
        buffer_view_type dct1In_m, dct2In_m;
        spectrum_view_type dct1Out_m, dct2Out_m;

        field_view_type alf_m, bet_m;
    };
}  // namespace qsw

#include "FieldSolvers/MixedBoundarySolver.hpp"

#endif
