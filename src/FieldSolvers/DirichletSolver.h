//
// Class DirichletSolver
//   Solves the Poisson equation
//      -laplace(u) = rhs
//   on the N x N transverse grid with the five point Laplacian and u = 0 on
//   the whole perimeter. The interior (N - 2) x (N - 2) block is
//   transformed with a DST-I along y, every sine mode is solved with a
//   Thomas sweep along x, and a second DST-I brings the result back.
//   Used for the longitudinal electric field Ez.
//
#ifndef QSW_DIRICHLET_SOLVER_H
#define QSW_DIRICHLET_SOLVER_H

#include "Types/ViewTypes.h"

#include "FFT/BatchedRealFFT.h"

namespace qsw {

    template <typename T>
    class DirichletSolver {
    public:
        using field_view_type    = grid_view_type<T>;
        using buffer_view_type   = grid_view_type<T>;
        using spectrum_view_type = complex_grid_view_type<T>;

        /*!
         * @param gridSteps number of grid nodes per axis (N)
         * @param h grid step size
         */
        DirichletSolver(int gridSteps, T h);

        /*!
         * @param rhs right hand side on the full grid; only the interior is read
         * @param out solution on the full grid, zero on the perimeter
         */
        void solve(const field_view_type& rhs, const field_view_type& out);

    private:
        int n_m;
        T h_m;
        T mul_m;

        BatchedRealFFT<T> fft_m;

        // interior rows as odd extensions of length 2N - 2; entries 0 and
        // N - 1 of every row stay zero
        buffer_view_type dst1In_m, dst2In_m;
        spectrum_view_type dst1Out_m, dst2Out_m;

        field_view_type alf_m, bet_m;
    };
}  // namespace qsw

#include "FieldSolvers/DirichletSolver.hpp"

#endif
