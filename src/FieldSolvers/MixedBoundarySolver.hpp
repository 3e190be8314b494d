//
// Class MixedBoundarySolver
//   Solves -laplace(u) + s * u = rhs with one Dirichlet and one reflecting
//   axis.
//
#include <vector>

#include "Utility/Logging.h"
#include "Utility/ParallelDispatch.h"
#include "Utility/QswException.h"

#include "FieldSolvers/TridiagonalSweep.h"

namespace qsw {

    template <typename T>
    MixedBoundarySolver<T>::MixedBoundarySolver(int gridSteps, T h, T s)
        : n_m(gridSteps)
        , h_m(h)
        , s_m(s)
        , mul_m(h * h / (2 * gridSteps - 2))
        , fft_m(gridSteps, 2 * gridSteps - 2)
        , dct1In_m("mixed_dct1_in", gridSteps, 2 * gridSteps - 2)
        , dct2In_m("mixed_dct2_in", gridSteps, 2 * gridSteps - 2)
        , dct1Out_m("mixed_dct1_out", gridSteps, gridSteps)
        , dct2Out_m("mixed_dct2_out", gridSteps, gridSteps)
        , bet_m("mixed_bet", gridSteps, gridSteps) {
        if (s < 0) {
            throw QswException("MixedBoundarySolver::MixedBoundarySolver()",
                               "The screening term must not be negative.");
        }

        std::vector<int> modes(n_m);
        for (int k = 0; k < n_m; ++k) {
            modes[k] = k;
        }
        // unknowns 1 ... N - 2 of every mode; nodes 0 and N - 1 are zero
        alf_m = detail::sweepCoefficients(detail::transformedDiagonal(modes, n_m, h * h * s), 1,
                                          n_m - 2, "mixed_alf");
    }

    template <typename T>
    void MixedBoundarySolver<T>::solve(const field_view_type& rhs, const field_view_type& out,
                                       SweepAxis axis) {
        SPDLOG_SCOPE("MixedBoundarySolver::solve, sweep along {}",
                     axis == SweepAxis::X ? "x" : "y");

        const int n        = n_m;
        const int len      = 2 * n_m - 2;
        const bool sweepX  = (axis == SweepAxis::X);
        const T mul        = mul_m;
        auto dct1In        = dct1In_m;
        auto dct2In        = dct2In_m;
        auto dct1Out       = dct1Out_m;
        auto dct2Out       = dct2Out_m;
        auto alf           = alf_m;
        auto bet           = bet_m;

        // 1. even extension of every line along the transform axis
        Kokkos::parallel_for(
            "MixedBoundarySolver::pack", getRangePolicy(rhs),
            KOKKOS_LAMBDA(const int i, const int j) {
                const int row = sweepX ? i : j;
                const int col = sweepX ? j : i;
                const T v     = rhs(i, j);
                dct1In(row, col) = v;
                if (col > 0 && col < n - 1) {
                    dct1In(row, len - col) = v;
                }
            });

        fft_m.transform(dct1In, dct1Out);

        // 2. one tridiagonal system per cosine mode along the sweep axis
        Kokkos::parallel_for(
            "MixedBoundarySolver::sweep", getLinePolicy(n),
            KOKKOS_LAMBDA(const int k) {
                bet(k, 0) = 0;
                bet(k, 1) = 0;
                for (int j = 1; j < n - 1; ++j) {
                    bet(k, j + 1) = (mul * dct1Out(j, k).real() + bet(k, j)) * alf(k, j + 1);
                }

                dct2In(n - 1, k) = 0;
                for (int j = n - 2; j >= 0; --j) {
                    dct2In(j, k) = alf(k, j + 1) * dct2In(j + 1, k) + bet(k, j + 1);
                }

                if (k > 0 && k < n - 1) {
                    for (int j = 0; j < n; ++j) {
                        dct2In(j, len - k) = dct2In(j, k);
                    }
                }
            });

        fft_m.transform(dct2In, dct2Out);

        // 3. back to grid order
        Kokkos::parallel_for(
            "MixedBoundarySolver::unpack", getRangePolicy(out),
            KOKKOS_LAMBDA(const int i, const int j) {
                out(i, j) = sweepX ? dct2Out(i, j).real() : dct2Out(j, i).real();
            });
        Kokkos::fence();
    }
}  // namespace qsw
