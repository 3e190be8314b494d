//
// Class PlasmaPusher
//   Advances the coarse plasma electrons by one xi step.
//
#include <utility>

#include "Utility/Logging.h"
#include "Utility/ParallelDispatch.h"

#include "Interpolation/QuadraticSpline.h"

namespace qsw {

    template <typename T>
    PlasmaPusher<T>::PlasmaPusher(const GridGeometry<T>& grid,
                                  const PlasmaParticles<T>& particles, T xiStepSize)
        : grid_m(grid)
        , particles_m(particles)
        , xiStepSize_m(xiStepSize) {}

    template <typename T>
    void PlasmaPusher<T>::estimate(const ParticleState<T>& prev,
                                   const attribute_view_type& xOfft,
                                   const attribute_view_type& yOfft) const {
        const T dxi = xiStepSize_m;
        const T b   = grid_m.reflectBoundary();
        auto m      = particles_m.m();
        auto xInit  = particles_m.xInit();
        auto yInit  = particles_m.yInit();
        auto x0     = prev.xOfft;
        auto y0     = prev.yOfft;
        auto px     = prev.px;
        auto py     = prev.py;
        auto pz     = prev.pz;

        Kokkos::parallel_for(
            "PlasmaPusher::estimate", getRangePolicy(m), KOKKOS_LAMBDA(const int i, const int j) {
                const T mass   = m(i, j);
                const T gammaM = Kokkos::sqrt(mass * mass + px(i, j) * px(i, j)
                                              + py(i, j) * py(i, j) + pz(i, j) * pz(i, j));

                T x = xInit(i, j) + x0(i, j) + px(i, j) / (gammaM - pz(i, j)) * dxi;
                T y = yInit(i, j) + y0(i, j) + py(i, j) / (gammaM - pz(i, j)) * dxi;

                x = (x <= b) ? x : 2 * b - x;
                x = (x >= -b) ? x : -2 * b - x;
                y = (y <= b) ? y : 2 * b - y;
                y = (y >= -b) ? y : -2 * b - y;

                xOfft(i, j) = x - xInit(i, j);
                yOfft(i, j) = y - yInit(i, j);
            });
    }

    template <typename T>
    void PlasmaPusher<T>::push(const ParticleState<T>& prev, const attribute_view_type& estXOfft,
                               const attribute_view_type& estYOfft, const FieldSet<T>& fields,
                               const ParticleState<T>& next) const {
        SPDLOG_DEBUG("push {} x {} coarse particles", particles_m.count(), particles_m.count());

        const int gridSteps = grid_m.size();
        const T h           = grid_m.stepSize();
        const T dxi         = xiStepSize_m;
        const T b           = grid_m.reflectBoundary();
        auto m              = particles_m.m();
        auto q              = particles_m.q();
        auto xInit          = particles_m.xInit();
        auto yInit          = particles_m.yInit();
        auto prevX          = prev.xOfft;
        auto prevY          = prev.yOfft;
        auto prevPx         = prev.px;
        auto prevPy         = prev.py;
        auto prevPz         = prev.pz;
        auto fEx            = fields.Ex;
        auto fEy            = fields.Ey;
        auto fEz            = fields.Ez;
        auto fBx            = fields.Bx;
        auto fBy            = fields.By;
        auto nextX          = next.xOfft;
        auto nextY          = next.yOfft;
        auto nextPx         = next.px;
        auto nextPy         = next.py;
        auto nextPz         = next.pz;

        Kokkos::parallel_for(
            "PlasmaPusher::push", getRangePolicy(m), KOKKOS_LAMBDA(const int i, const int j) {
                const T mass   = m(i, j);
                const T charge = q(i, j);
                const T opx    = prevPx(i, j);
                const T opy    = prevPy(i, j);
                const T opz    = prevPz(i, j);

                const T xHalf = xInit(i, j) + (prevX(i, j) + estXOfft(i, j)) / 2;
                const T yHalf = yInit(i, j) + (prevY(i, j) + estYOfft(i, j)) / 2;

                const auto stencil    = detail::splineStencil(xHalf, yHalf, gridSteps, h);
                constexpr auto points = std::make_index_sequence<9>{};
                const T Ex            = detail::gatherFromField(points, fEx, stencil);
                const T Ey            = detail::gatherFromField(points, fEy, stencil);
                const T Ez            = detail::gatherFromField(points, fEz, stencil);
                const T Bx            = detail::gatherFromField(points, fBx, stencil);
                const T By            = detail::gatherFromField(points, fBy, stencil);

                T px = opx, py = opy, pz = opz;
                T dpx = 0, dpy = 0, dpz = 0;
                for (int iter = 0; iter < 2; ++iter) {
                    const T gammaM = Kokkos::sqrt(mass * mass + px * px + py * py + pz * pz);
                    const T vx     = px / gammaM;
                    const T vy     = py / gammaM;
                    const T vz     = pz / gammaM;
                    const T factor = charge * dxi / (1 - pz / gammaM);
                    dpx            = factor * (Ex - vz * By);
                    dpy            = factor * (Ey + vz * Bx);
                    dpz            = factor * (Ez + vx * By - vy * Bx);
                    px             = opx + dpx / 2;
                    py             = opy + dpy / 2;
                    pz             = opz + dpz / 2;
                }

                const T gammaM = Kokkos::sqrt(mass * mass + px * px + py * py + pz * pz);
                T xOfft        = prevX(i, j) + px / (gammaM - pz) * dxi;
                T yOfft        = prevY(i, j) + py / (gammaM - pz) * dxi;

                px = opx + dpx;
                py = opy + dpy;
                pz = opz + dpz;

                T x = xInit(i, j) + xOfft;
                T y = yInit(i, j) + yOfft;
                if (x > b) {
                    x     = 2 * b - x;
                    xOfft = x - xInit(i, j);
                    px    = -px;
                }
                if (x < -b) {
                    x     = -2 * b - x;
                    xOfft = x - xInit(i, j);
                    px    = -px;
                }
                if (y > b) {
                    y     = 2 * b - y;
                    yOfft = y - yInit(i, j);
                    py    = -py;
                }
                if (y < -b) {
                    y     = -2 * b - y;
                    yOfft = y - yInit(i, j);
                    py    = -py;
                }

                nextX(i, j)  = xOfft;
                nextY(i, j)  = yOfft;
                nextPx(i, j) = px;
                nextPy(i, j) = py;
                nextPz(i, j) = pz;
            });
    }
}  // namespace qsw
