//
// Class VirtualizationTable
//   Bilinear coarse-to-fine interpolation table.
//
#include <algorithm>

#include "Utility/QswException.h"

namespace qsw {

    template <typename T>
    VirtualizationTable<T>::VirtualizationTable(const std::vector<T>& coarse,
                                                const std::vector<T>& fine, T coarseStep)
        : nCoarse_m(coarse.size())
        , nFine_m(fine.size()) {
        if (nCoarse_m < 2) {
            throw QswException("VirtualizationTable::VirtualizationTable()",
                               "At least two coarse particles per axis are required.");
        }
        if (nFine_m < 1) {
            throw QswException("VirtualizationTable::VirtualizationTable()",
                               "The fine lattice is empty.");
        }

        // 1D influences, identical for both axes
        std::vector<int> prev(nFine_m), next(nFine_m);
        std::vector<T> influencePrev(nFine_m), influenceNext(nFine_m);
        for (int f = 0; f < nFine_m; ++f) {
            const int idx = std::lower_bound(coarse.begin(), coarse.end(), fine[f]) - coarse.begin();
            next[f]       = std::clamp(idx, 0, nCoarse_m - 1);
            prev[f]       = std::clamp(idx - 1, 0, nCoarse_m - 1);

            if (fine[f] <= coarse.front()) {
                influencePrev[f] = 0;
                influenceNext[f] = 1;
            } else if (fine[f] > coarse.back()) {
                influencePrev[f] = 1;
                influenceNext[f] = 0;
            } else {
                influencePrev[f] = (coarse[next[f]] - fine[f]) / coarseStep;
                influenceNext[f] = (fine[f] - coarse[prev[f]]) / coarseStep;
            }
        }

        wA_m          = weight_view_type("virt_A", nFine_m, nFine_m);
        wB_m          = weight_view_type("virt_B", nFine_m, nFine_m);
        wC_m          = weight_view_type("virt_C", nFine_m, nFine_m);
        wD_m          = weight_view_type("virt_D", nFine_m, nFine_m);
        indicesPrev_m = index_view_type("virt_indices_prev", nFine_m);
        indicesNext_m = index_view_type("virt_indices_next", nFine_m);
        fineLattice_m = coord_view_type("virt_fine_lattice", nFine_m);

        auto hA    = Kokkos::create_mirror_view(wA_m);
        auto hB    = Kokkos::create_mirror_view(wB_m);
        auto hC    = Kokkos::create_mirror_view(wC_m);
        auto hD    = Kokkos::create_mirror_view(wD_m);
        auto hPrev = Kokkos::create_mirror_view(indicesPrev_m);
        auto hNext = Kokkos::create_mirror_view(indicesNext_m);
        auto hFine = Kokkos::create_mirror_view(fineLattice_m);

        for (int fx = 0; fx < nFine_m; ++fx) {
            hPrev(fx) = prev[fx];
            hNext(fx) = next[fx];
            hFine(fx) = fine[fx];
            for (int fy = 0; fy < nFine_m; ++fy) {
                hA(fx, fy) = influencePrev[fx] * influencePrev[fy];
                hB(fx, fy) = influenceNext[fx] * influencePrev[fy];
                hC(fx, fy) = influencePrev[fx] * influenceNext[fy];
                hD(fx, fy) = influenceNext[fx] * influenceNext[fy];
            }
        }

        Kokkos::deep_copy(wA_m, hA);
        Kokkos::deep_copy(wB_m, hB);
        Kokkos::deep_copy(wC_m, hC);
        Kokkos::deep_copy(wD_m, hD);
        Kokkos::deep_copy(indicesPrev_m, hPrev);
        Kokkos::deep_copy(indicesNext_m, hNext);
        Kokkos::deep_copy(fineLattice_m, hFine);
    }
}  // namespace qsw
