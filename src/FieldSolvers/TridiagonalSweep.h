//
// TridiagonalSweep
//   Forward elimination coefficients of the Thomas algorithm for the
//   constant coefficient systems
//      -u[j - 1] + diag * u[j] - u[j + 1] = f[j]
//   that remain per spectral mode after a sine or cosine transform of the
//   five point Laplacian along one axis. With alf[first] = 0 the
//   coefficients are
//      alf[j + 1] = 1 / (diag - alf[j])
//   and the sweep itself is
//      bet[j + 1] = (f[j] + bet[j]) * alf[j + 1]          (forward)
//      u[j]       = alf[j + 1] * u[j + 1] + bet[j + 1]     (backward)
//   The coefficients depend only on the grid, so they are computed once per
//   solver on the host.
//
#ifndef QSW_TRIDIAGONAL_SWEEP_H
#define QSW_TRIDIAGONAL_SWEEP_H

#include <Kokkos_Core.hpp>
#include <cmath>
#include <string>
#include <vector>

#include "Types/ViewTypes.h"

namespace qsw {
    namespace detail {
        /*!
         * Tabulates the elimination coefficients of all modes
         * @param diag main diagonal per mode
         * @param first index of the first unknown of the sweep
         * @param count number of elimination steps
         * @param label view label
         * @return a (modes x first + count + 1) device view; row k holds alf of mode k
         */
        template <typename T>
        grid_view_type<T> sweepCoefficients(const std::vector<T>& diag, int first, int count,
                                            const std::string& label) {
            const int modes = diag.size();
            grid_view_type<T> alf(label, modes, first + count + 1);
            auto half = Kokkos::create_mirror_view(alf);
            Kokkos::deep_copy(half, T(0));
            for (int k = 0; k < modes; ++k) {
                for (int j = first; j < first + count; ++j) {
                    half(k, j + 1) = T(1) / (diag[k] - half(k, j));
                }
            }
            Kokkos::deep_copy(alf, half);
            return alf;
        }

        /*!
         * Main diagonal of the transformed Laplacian: 2 + 4 sin^2(k pi / (2 (N - 1))),
         * plus an optional shift
         * @param modes list of spectral indices k
         * @param gridSteps N
         * @param shift constant added to every entry
         */
        template <typename T>
        std::vector<T> transformedDiagonal(const std::vector<int>& modes, int gridSteps, T shift) {
            constexpr T pi = Kokkos::numbers::pi_v<T>;

            std::vector<T> diag(modes.size());
            for (size_t m = 0; m < modes.size(); ++m) {
                const T s = std::sin(modes[m] * pi / (2 * (gridSteps - 1)));
                diag[m]   = 2 + 4 * s * s + shift;
            }
            return diag;
        }
    }  // namespace detail
}  // namespace qsw

#endif
