//
// Class FieldSources
//   Right hand sides of the transverse field equations of one slice.
//

#include "Utility/ParallelDispatch.h"

namespace qsw {

    template <typename T>
    FieldSources<T>::FieldSources(const GridGeometry<T>& grid, T xiStepSize, T subtractionTrick)
        : n_m(grid.size())
        , h_m(grid.stepSize())
        , xiStepSize_m(xiStepSize)
        , subtractionTrick_m(subtractionTrick) {}

    template <typename T>
    void FieldSources<T>::mixed(const SourceSet<T>& sources, const SourceSet<T>& prevSources,
                                const field_view_type& beamRo, const FieldSet<T>& sub,
                                const FieldSet<T>& rhs) const {
        const int n     = n_m;
        const T h2      = 2 * h_m;
        const T dxi     = xiStepSize_m;
        const T s       = subtractionTrick_m;
        auto ro         = sources.ro;
        auto jx         = sources.jx;
        auto jy         = sources.jy;
        auto jz         = sources.jz;
        auto jxPrev     = prevSources.jx;
        auto jyPrev     = prevSources.jy;
        auto ExSub      = sub.Ex;
        auto EySub      = sub.Ey;
        auto BxSub      = sub.Bx;
        auto BySub      = sub.By;
        auto ExRhs      = rhs.Ex;
        auto EyRhs      = rhs.Ey;
        auto BxRhs      = rhs.Bx;
        auto ByRhs      = rhs.By;

        Kokkos::parallel_for(
            "FieldSources::mixed", getRangePolicy(ro), KOKKOS_LAMBDA(const int i, const int j) {
                const bool innerX = (i > 0 && i < n - 1);
                const bool innerY = (j > 0 && j < n - 1);

                const T droDx = innerX ? (ro(i + 1, j) + beamRo(i + 1, j) - ro(i - 1, j)
                                          - beamRo(i - 1, j))
                                             / h2
                                       : T(0);
                const T droDy = innerY ? (ro(i, j + 1) + beamRo(i, j + 1) - ro(i, j - 1)
                                          - beamRo(i, j - 1))
                                             / h2
                                       : T(0);
                const T djzDx = innerX ? (jz(i + 1, j) + beamRo(i + 1, j) - jz(i - 1, j)
                                          - beamRo(i - 1, j))
                                             / h2
                                       : T(0);
                const T djzDy = innerY ? (jz(i, j + 1) + beamRo(i, j + 1) - jz(i, j - 1)
                                          - beamRo(i, j - 1))
                                             / h2
                                       : T(0);
                const T djxDxi = (jxPrev(i, j) - jx(i, j)) / dxi;
                const T djyDxi = (jyPrev(i, j) - jy(i, j)) / dxi;

                ExRhs(i, j) = -((droDx - djxDxi) - s * ExSub(i, j));
                EyRhs(i, j) = -((droDy - djyDxi) - s * EySub(i, j));
                BxRhs(i, j) = +((djzDy - djyDxi) + s * BxSub(i, j));
                ByRhs(i, j) = -((djzDx - djxDxi) - s * BySub(i, j));
            });
    }

    template <typename T>
    void FieldSources<T>::longitudinal(const SourceSet<T>& sources,
                                       const field_view_type& rhs) const {
        const int n = n_m;
        const T h2  = 2 * h_m;
        auto jx     = sources.jx;
        auto jy     = sources.jy;

        Kokkos::parallel_for(
            "FieldSources::longitudinal", getRangePolicy(rhs),
            KOKKOS_LAMBDA(const int i, const int j) {
                if (i == 0 || j == 0 || i == n - 1 || j == n - 1) {
                    rhs(i, j) = 0;
                } else {
                    const T djxDx = (jx(i + 1, j) - jx(i - 1, j)) / h2;
                    const T djyDy = (jy(i, j + 1) - jy(i, j - 1)) / h2;
                    rhs(i, j)     = -(djxDx + djyDy);
                }
            });
    }
}  // namespace qsw
