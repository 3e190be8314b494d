//
// ResidualCheck
//   Maximum norm of the residual
//      r = -laplace(u) + s * u - rhs
//   of a computed field, relative to the maximum norm of rhs (absolute if
//   rhs vanishes). The mixed boundary variant evaluates r on the interior
//   lines of the sweep axis and on every node of the transform axis, with
//   mirrored neighbors on the reflecting boundary; the Dirichlet variant
//   evaluates r on the interior.
//
#ifndef QSW_RESIDUAL_CHECK_H
#define QSW_RESIDUAL_CHECK_H

#include "Types/ViewTypes.h"

#include "FieldSolvers/MixedBoundarySolver.h"
#include "Utility/ParallelDispatch.h"

namespace qsw {
    namespace detail {
        template <typename T>
        T maxNorm(const grid_view_type<T>& view) {
            T norm = 0;
            Kokkos::parallel_reduce(
                "maxNorm", getRangePolicy(view),
                KOKKOS_LAMBDA(const int i, const int j, T& lmax) {
                    lmax = Kokkos::fmax(lmax, Kokkos::fabs(view(i, j)));
                },
                Kokkos::Max<T>(norm));
            return norm;
        }

        template <typename T>
        T relativeTo(T residual, T reference) {
            return reference > 0 ? residual / reference : residual;
        }
    }  // namespace detail

    template <typename T>
    T mixedResidual(const grid_view_type<T>& u, const grid_view_type<T>& rhs, T s, T h,
                    SweepAxis axis) {
        const int n        = u.extent(0);
        const bool sweepX  = (axis == SweepAxis::X);
        const T invH2      = 1 / (h * h);

        T residual = 0;
        Kokkos::parallel_reduce(
            "mixedResidual", getRangePolicy(u), KOKKOS_LAMBDA(const int i, const int j, T& lmax) {
                const int sweep = sweepX ? i : j;
                if (sweep == 0 || sweep == n - 1) {
                    return;
                }
                // reflecting boundary: the ghost node mirrors its inner neighbor
                const int im = (i == 0) ? 1 : i - 1;
                const int ip = (i == n - 1) ? n - 2 : i + 1;
                const int jm = (j == 0) ? 1 : j - 1;
                const int jp = (j == n - 1) ? n - 2 : j + 1;

                const T lap = (u(ip, j) + u(im, j) + u(i, jp) + u(i, jm) - 4 * u(i, j)) * invH2;
                const T r   = -lap + s * u(i, j) - rhs(i, j);
                lmax        = Kokkos::fmax(lmax, Kokkos::fabs(r));
            },
            Kokkos::Max<T>(residual));

        return detail::relativeTo(residual, detail::maxNorm(rhs));
    }

    template <typename T>
    T dirichletResidual(const grid_view_type<T>& u, const grid_view_type<T>& rhs, T h) {
        const T invH2 = 1 / (h * h);

        T residual = 0;
        Kokkos::parallel_reduce(
            "dirichletResidual", getRangePolicy(u, 1),
            KOKKOS_LAMBDA(const int i, const int j, T& lmax) {
                const T lap =
                    (u(i + 1, j) + u(i - 1, j) + u(i, j + 1) + u(i, j - 1) - 4 * u(i, j)) * invH2;
                lmax = Kokkos::fmax(lmax, Kokkos::fabs(-lap - rhs(i, j)));
            },
            Kokkos::Max<T>(residual));

        return detail::relativeTo(residual, detail::maxNorm(rhs));
    }
}  // namespace qsw

#endif
