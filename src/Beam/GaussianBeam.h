//
// Struct GaussianBeam
//   Charge density of a round Gaussian driver of finite length. The density
//   grows from zero at the head (xi = 0) as 1 - cos(xi * compress * sqrt(pi / 2))
//   and ends after one full period, at xi = -2 sqrt(2 pi) / compress.
//
#ifndef QSW_GAUSSIAN_BEAM_H
#define QSW_GAUSSIAN_BEAM_H

#include <Kokkos_Core.hpp>
#include <cmath>

namespace qsw {

    struct GaussianBeam {
        double xiStepSize;
        double compress = 1;
        double boost    = 1;
        double sigma    = 1;
        // offset of the beam axis along y
        double shift = 0;

        // xi coordinate of the tail
        double tail() const {
            constexpr double pi = Kokkos::numbers::pi_v<double>;
            return -2 * std::sqrt(2 * pi) / compress;
        }

        double operator()(int xiIndex, double x, double y) const {
            constexpr double pi = Kokkos::numbers::pi_v<double>;

            const double xi = -xiIndex * xiStepSize;
            if (xi < tail()) {
                return 0;
            }
            const double r = std::sqrt(x * x + (y - shift) * (y - shift));
            return .05 * boost * std::exp(-.5 * (r / sigma) * (r / sigma))
                   * (1 - std::cos(xi * compress * std::sqrt(pi / 2)));
        }
    };
}  // namespace qsw

#endif
