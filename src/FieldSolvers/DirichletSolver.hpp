//
// Class DirichletSolver
//   Solves -laplace(u) = rhs with u = 0 on the perimeter.
//
#include <vector>

#include "Utility/Logging.h"
#include "Utility/ParallelDispatch.h"
#include "Utility/QswException.h"

#include "FieldSolvers/TridiagonalSweep.h"

namespace qsw {

    template <typename T>
    DirichletSolver<T>::DirichletSolver(int gridSteps, T h)
        : n_m(gridSteps)
        , h_m(h)
        , mul_m(h * h / (2 * gridSteps - 2))
        , fft_m(gridSteps - 2, 2 * gridSteps - 2)
        , dst1In_m("dirichlet_dst1_in", gridSteps - 2, 2 * gridSteps - 2)
        , dst2In_m("dirichlet_dst2_in", gridSteps - 2, 2 * gridSteps - 2)
        , dst1Out_m("dirichlet_dst1_out", gridSteps - 2, gridSteps)
        , dst2Out_m("dirichlet_dst2_out", gridSteps - 2, gridSteps)
        , bet_m("dirichlet_bet", gridSteps - 2, gridSteps - 1) {
        // sine modes 1 ... N - 2, unknowns 0 ... N - 3 of the interior
        const int interior = n_m - 2;
        std::vector<int> modes(interior);
        for (int k = 0; k < interior; ++k) {
            modes[k] = k + 1;
        }
        alf_m = detail::sweepCoefficients(detail::transformedDiagonal(modes, n_m, T(0)), 0,
                                          interior, "dirichlet_alf");
    }

    template <typename T>
    void DirichletSolver<T>::solve(const field_view_type& rhs, const field_view_type& out) {
        SPDLOG_SCOPE("DirichletSolver::solve");

        const int ns   = n_m - 2;
        const int last = 2 * n_m - 3;
        const T mul    = mul_m;
        auto dst1In    = dst1In_m;
        auto dst2In    = dst2In_m;
        auto dst1Out   = dst1Out_m;
        auto dst2Out   = dst2Out_m;
        auto alf       = alf_m;
        auto bet       = bet_m;

        // 1. odd extension of the interior rows
        Kokkos::parallel_for(
            "DirichletSolver::pack", getRangePolicy(rhs, 1),
            KOKKOS_LAMBDA(const int i, const int j) {
                const T v             = rhs(i, j);
                dst1In(i - 1, j)        = v;
                dst1In(i - 1, last + 1 - j) = -v;
            });

        fft_m.transform(dst1In, dst1Out);

        // 2. one tridiagonal system per sine mode; the DST-I coefficient of
        // mode k + 1 is minus the imaginary part of the transform
        Kokkos::parallel_for(
            "DirichletSolver::sweep", getLinePolicy(ns),
            KOKKOS_LAMBDA(const int k) {
                bet(k, 0) = 0;
                for (int j = 0; j < ns; ++j) {
                    bet(k, j + 1) = (mul * -dst1Out(j, k + 1).imag() + bet(k, j)) * alf(k, j + 1);
                }

                T u                    = bet(k, ns);
                dst2In(ns - 1, k + 1)    = u;
                dst2In(ns - 1, last - k) = -u;
                for (int j = ns - 2; j >= 0; --j) {
                    u                   = alf(k, j + 1) * u + bet(k, j + 1);
                    dst2In(j, k + 1)    = u;
                    dst2In(j, last - k) = -u;
                }
            });

        fft_m.transform(dst2In, dst2Out);

        // 3. back to grid order, zero on the perimeter
        Kokkos::parallel_for(
            "DirichletSolver::unpack", getRangePolicy(out),
            KOKKOS_LAMBDA(const int i, const int j) {
                if (i == 0 || j == 0 || i == ns + 1 || j == ns + 1) {
                    out(i, j) = 0;
                } else {
                    out(i, j) = -dst2Out(i - 1, j).imag();
                }
            });
        Kokkos::fence();
    }
}  // namespace qsw
