//
// Class Depositor
//   Deposits charge density and current of the plasma electrons onto the
//   transverse grid.
//
#include <utility>

#include "Utility/Logging.h"
#include "Utility/ParallelDispatch.h"
#include "Utility/QswException.h"

#include "Interpolation/QuadraticSpline.h"

namespace qsw {

    template <typename T>
    Depositor<T>::Depositor(const GridGeometry<T>& grid, const VirtualizationTable<T>& table,
                            const PlasmaParticles<T>& particles, int coarseness, int fineness)
        : grid_m(grid)
        , table_m(table)
        , particles_m(particles)
        , smallness_m(T(1) / (T(coarseness * fineness) * T(coarseness * fineness)))
        , roInitial_m("ro_initial", grid.size(), grid.size()) {
        if (particles.count() != table.coarseCount()) {
            throw QswException("Depositor::Depositor()",
                               "The particle ensemble does not match the interpolation table.");
        }
    }

    template <typename T>
    void Depositor<T>::deposit(const attribute_view_type& xOfft,
                               const attribute_view_type& yOfft,
                               const attribute_view_type& px, const attribute_view_type& py,
                               const attribute_view_type& pz, const field_view_type& ro,
                               const field_view_type& jx, const field_view_type& jy,
                               const field_view_type& jz) const {
        SPDLOG_DEBUG("deposit {} x {} virtual particles", table_m.fineCount(),
                     table_m.fineCount());

        Kokkos::deep_copy(ro, T(0));
        Kokkos::deep_copy(jx, T(0));
        Kokkos::deep_copy(jy, T(0));
        Kokkos::deep_copy(jz, T(0));

        const int gridSteps = grid_m.size();
        const T h           = grid_m.stepSize();
        const T smallness   = smallness_m;

        auto fine  = table_m.fineLattice();
        auto prev  = table_m.indicesPrev();
        auto next  = table_m.indicesNext();
        auto wA    = table_m.weightA();
        auto wB    = table_m.weightB();
        auto wC    = table_m.weightC();
        auto wD    = table_m.weightD();
        auto m     = particles_m.m();
        auto q     = particles_m.q();
        auto outRo = ro;
        auto outJx = jx;
        auto outJy = jy;
        auto outJz = jz;

        Kokkos::parallel_for(
            "Depositor::deposit", getRangePolicy(wA), KOKKOS_LAMBDA(const int fi, const int fj) {
                const int cpx = prev(fi), cnx = next(fi);
                const int cpy = prev(fj), cny = next(fj);

                const T A = wA(fi, fj);
                const T B = wB(fi, fj);
                const T C = wC(fi, fj);
                const T D = wD(fi, fj);

                auto bilinear = [&](const attribute_view_type& a) {
                    return A * a(cpx, cpy) + B * a(cnx, cpy) + C * a(cpx, cny) + D * a(cnx, cny);
                };

                const T x = fine(fi) + bilinear(xOfft);
                const T y = fine(fj) + bilinear(yOfft);

                const T vm  = bilinear(m) * smallness;
                const T vq  = bilinear(q) * smallness;
                const T vpx = bilinear(px) * smallness;
                const T vpy = bilinear(py) * smallness;
                const T vpz = bilinear(pz) * smallness;

                const T gammaM = Kokkos::sqrt(vm * vm + vpx * vpx + vpy * vpy + vpz * vpz);
                const T dro    = vq / (1 - vpz / gammaM);
                const T djx    = vpx * (dro / gammaM);
                const T djy    = vpy * (dro / gammaM);
                const T djz    = vpz * (dro / gammaM);

                const auto stencil = detail::splineStencil(x, y, gridSteps, h);
                constexpr auto points = std::make_index_sequence<9>{};
                detail::scatterToField(points, outRo, stencil, dro);
                detail::scatterToField(points, outJx, stencil, djx);
                detail::scatterToField(points, outJy, stencil, djy);
                detail::scatterToField(points, outJz, stencil, djz);
            });

        // the background goes last, after all small contributions are summed
        auto roInitial = roInitial_m;
        Kokkos::parallel_for(
            "Depositor::addBackground", getRangePolicy(outRo),
            KOKKOS_LAMBDA(const int i, const int j) { outRo(i, j) += roInitial(i, j); });
    }

    template <typename T>
    void Depositor<T>::initialDeposition(const attribute_view_type& xOfft,
                                         const attribute_view_type& yOfft,
                                         const attribute_view_type& px,
                                         const attribute_view_type& py,
                                         const attribute_view_type& pz) {
        T maxMomentum = 0;
        Kokkos::parallel_reduce(
            "Depositor::checkResting", getRangePolicy(px),
            KOKKOS_LAMBDA(const int i, const int j, T& lmax) {
                const T p = Kokkos::fmax(Kokkos::fabs(px(i, j)),
                                         Kokkos::fmax(Kokkos::fabs(py(i, j)), Kokkos::fabs(pz(i, j))));
                lmax = Kokkos::fmax(lmax, p);
            },
            Kokkos::Max<T>(maxMomentum));
        if (maxMomentum != 0) {
            throw QswException("Depositor::initialDeposition()",
                               "The ion background requires a plasma at rest.");
        }

        const int n = grid_m.size();
        Kokkos::deep_copy(roInitial_m, T(0));
        field_view_type roElectrons("ro_electrons", n, n);
        field_view_type jx("jx_electrons", n, n);
        field_view_type jy("jy_electrons", n, n);
        field_view_type jz("jz_electrons", n, n);
        deposit(xOfft, yOfft, px, py, pz, roElectrons, jx, jy, jz);

        auto roInitial = roInitial_m;
        Kokkos::parallel_for(
            "Depositor::initialDeposition", getRangePolicy(roInitial),
            KOKKOS_LAMBDA(const int i, const int j) { roInitial(i, j) = -roElectrons(i, j); });
        Kokkos::fence();
    }
}  // namespace qsw
