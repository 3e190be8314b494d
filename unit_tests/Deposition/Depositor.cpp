//
// Unit test DepositorTest
//   Test the deposition of the virtualized plasma and the ion background.
//
#include "Qsw.h"

#include <array>
#include <cmath>
#include <random>

#include "Deposition/Depositor.h"
#include "Grid/GridGeometry.h"
#include "Plasma/PlasmaLattice.h"
#include "State/SliceState.h"
#include "Utility/QswException.h"

#include "TestUtils.h"
#include "gtest/gtest.h"

class DepositorTest : public ::testing::Test {
public:
    using view_type = qsw::grid_view_type<double>;

    DepositorTest()
        : grid(n, h, reflectPadding)
        , coarse(qsw::makeCoarseLattice(plasmaSteps, h, coarseness))
        , particles(coarse, coarseness)
        , table(coarse, qsw::makeFineLattice(plasmaSteps, h, fineness), h * coarseness)
        , depositor(grid, table, particles, coarseness, fineness)
        , state(qsw::ParticleState<double>::zeros(particles.count()))
        , sources(qsw::SourceSet<double>::zeros(n)) {}

    void deposit() {
        depositor.deposit(state.xOfft, state.yOfft, state.px, state.py, state.pz, sources.ro,
                          sources.jx, sources.jy, sources.jz);
        Kokkos::fence();
    }

    void initialDeposition() {
        depositor.initialDeposition(state.xOfft, state.yOfft, state.px, state.py, state.pz);
    }

    /*!
     * Fills offsets and momenta of all coarse particles with uniform random
     * numbers; the offsets stay below one cell so that no stencil leaves the grid
     */
    void randomize(unsigned seed, double pMax, bool longitudinal) {
        std::mt19937_64 eng(seed);
        std::uniform_real_distribution<double> offset(-0.9 * h, 0.9 * h);
        std::uniform_real_distribution<double> momentum(-pMax, pMax);

        auto fill = [&](const view_type& v, std::uniform_real_distribution<double>& dist) {
            auto host = Kokkos::create_mirror_view(v);
            for (size_t i = 0; i < host.extent(0); ++i) {
                for (size_t j = 0; j < host.extent(1); ++j) {
                    host(i, j) = dist(eng);
                }
            }
            Kokkos::deep_copy(v, host);
        };
        fill(state.xOfft, offset);
        fill(state.yOfft, offset);
        fill(state.px, momentum);
        fill(state.py, momentum);
        if (longitudinal) {
            fill(state.pz, momentum);
        }
    }

    /*!
     * Total charge and currents of the virtual electrons, summed particle by
     * particle on the host: {ro, jx, jy, jz}
     */
    std::array<double, 4> virtualTotals() const {
        auto prev = toHost(table.indicesPrev());
        auto next = toHost(table.indicesNext());
        auto wA   = toHost(table.weightA());
        auto wB   = toHost(table.weightB());
        auto wC   = toHost(table.weightC());
        auto wD   = toHost(table.weightD());
        auto m    = toHost(particles.m());
        auto q    = toHost(particles.q());
        auto px   = toHost(state.px);
        auto py   = toHost(state.py);
        auto pz   = toHost(state.pz);

        const double smallness = depositor.smallnessFactor();
        std::array<double, 4> totals{0, 0, 0, 0};
        for (size_t fi = 0; fi < wA.extent(0); ++fi) {
            for (size_t fj = 0; fj < wA.extent(1); ++fj) {
                auto bilinear = [&](const auto& a) {
                    return wA(fi, fj) * a(prev(fi), prev(fj)) + wB(fi, fj) * a(next(fi), prev(fj))
                           + wC(fi, fj) * a(prev(fi), next(fj))
                           + wD(fi, fj) * a(next(fi), next(fj));
                };
                const double vm  = bilinear(m) * smallness;
                const double vq  = bilinear(q) * smallness;
                const double vpx = bilinear(px) * smallness;
                const double vpy = bilinear(py) * smallness;
                const double vpz = bilinear(pz) * smallness;

                const double gammaM = std::sqrt(vm * vm + vpx * vpx + vpy * vpy + vpz * vpz);
                const double ro     = vq / (1 - vpz / gammaM);
                totals[0] += ro;
                totals[1] += ro * vpx / gammaM;
                totals[2] += ro * vpy / gammaM;
                totals[3] += ro * vpz / gammaM;
            }
        }
        return totals;
    }

    static constexpr int n              = 31;
    static constexpr double h           = 0.05;
    static constexpr int reflectPadding = 4;
    static constexpr int plasmaSteps    = n - 2 * 5;
    static constexpr int coarseness     = 2;
    static constexpr int fineness       = 2;

    qsw::GridGeometry<double> grid;
    std::vector<double> coarse;
    qsw::PlasmaParticles<double> particles;
    qsw::VirtualizationTable<double> table;
    qsw::Depositor<double> depositor;
    qsw::ParticleState<double> state;
    qsw::SourceSet<double> sources;
};

TEST_F(DepositorTest, SmallnessFactor) {
    EXPECT_DOUBLE_EQ(depositor.smallnessFactor(), 1.0 / 16);
}

TEST_F(DepositorTest, BackgroundNeutralizesRestingPlasma) {
    initialDeposition();

    // every virtual electron carries the charge -1 / F^2
    const int nf       = table.fineCount();
    const double total = sum(toHost(depositor.roInitial()));
    const double perElectron = 1.0 / (fineness * fineness);
    EXPECT_NEAR(total, nf * nf * perElectron, 1e-10);

    deposit();
    EXPECT_NEAR(maxAbs(toHost(sources.ro)), 0, 1e-12);
    EXPECT_NEAR(maxAbs(toHost(sources.jx)), 0, 1e-14);
    EXPECT_NEAR(maxAbs(toHost(sources.jy)), 0, 1e-14);
    EXPECT_NEAR(maxAbs(toHost(sources.jz)), 0, 1e-14);
}

TEST_F(DepositorTest, BackgroundRequiresRest) {
    Kokkos::deep_copy(state.pz, 1e-3);
    EXPECT_THROW(initialDeposition(), QswException);
}

TEST_F(DepositorTest, ChargeIsConservedUnderDisplacement) {
    initialDeposition();
    const double background = sum(toHost(depositor.roInitial()));

    // a smooth displacement that keeps all stencils on the grid
    auto ho = Kokkos::create_mirror_view(state.xOfft);
    for (int i = 0; i < particles.count(); ++i) {
        for (int j = 0; j < particles.count(); ++j) {
            ho(i, j) = 0.3 * h * std::sin(0.7 * i + 0.2 * j);
        }
    }
    Kokkos::deep_copy(state.xOfft, ho);
    Kokkos::deep_copy(state.yOfft, ho);

    deposit();
    // electrons and background cancel in total
    EXPECT_NEAR(sum(toHost(sources.ro)), 0, 1e-10 * background);
    // but not locally
    EXPECT_GT(maxAbs(toHost(sources.ro)), 1e-6);
}

TEST_F(DepositorTest, RandomTransverseEnsembleConservesCharge) {
    initialDeposition();
    const double background = sum(toHost(depositor.roInitial()));

    for (unsigned seed : {11u, 12u, 13u}) {
        randomize(seed, 2.0, false);
        deposit();

        EXPECT_NEAR(sum(toHost(sources.ro)), 0, 1e-10 * background) << "seed " << seed;
        EXPECT_GT(maxAbs(toHost(sources.ro)), 1e-6);

        const auto totals = virtualTotals();
        EXPECT_NEAR(sum(toHost(sources.jx)), totals[1], 1e-10) << "seed " << seed;
        EXPECT_NEAR(sum(toHost(sources.jy)), totals[2], 1e-10) << "seed " << seed;
        EXPECT_NEAR(maxAbs(toHost(sources.jz)), 0, 1e-14);
    }
}

TEST_F(DepositorTest, RandomEnsembleTotals) {
    initialDeposition();
    const double background = sum(toHost(depositor.roInitial()));

    for (unsigned seed : {21u, 22u, 23u}) {
        randomize(seed, 1.0, true);
        deposit();

        // every virtual electron deposits its full charge q / (1 - vz) on
        // top of the background
        const auto totals = virtualTotals();
        EXPECT_NEAR(sum(toHost(sources.ro)), totals[0] + background, 1e-10) << "seed " << seed;
        EXPECT_NEAR(sum(toHost(sources.jx)), totals[1], 1e-10) << "seed " << seed;
        EXPECT_NEAR(sum(toHost(sources.jy)), totals[2], 1e-10) << "seed " << seed;
        EXPECT_NEAR(sum(toHost(sources.jz)), totals[3], 1e-10) << "seed " << seed;

        // 1 - vz > 0 for any momentum, so the electron charge keeps its sign
        EXPECT_LT(totals[0], 0);
    }
}

TEST_F(DepositorTest, UniformTransverseMomentum) {
    initialDeposition();
    const double electrons = -sum(toHost(depositor.roInitial()));

    const double p0 = 0.5;
    Kokkos::deep_copy(state.px, p0);
    deposit();

    // pz = 0: the density is unchanged, the current is rho * vx
    const double m = coarseness * coarseness;
    EXPECT_NEAR(maxAbs(toHost(sources.ro)), 0, 1e-12);
    EXPECT_NEAR(sum(toHost(sources.jx)), electrons * p0 / std::sqrt(m * m + p0 * p0), 1e-10);
    EXPECT_NEAR(maxAbs(toHost(sources.jy)), 0, 1e-14);
    EXPECT_NEAR(maxAbs(toHost(sources.jz)), 0, 1e-14);
}

TEST_F(DepositorTest, LongitudinalMomentumCompressesDensity) {
    initialDeposition();
    const double electrons = -sum(toHost(depositor.roInitial()));

    const double pz = 0.5;
    Kokkos::deep_copy(state.pz, pz);
    deposit();

    const double m      = coarseness * coarseness;
    const double gammaM = std::sqrt(m * m + pz * pz);
    const double factor = 1 / (1 - pz / gammaM);
    EXPECT_NEAR(sum(toHost(sources.ro)), electrons * (factor - 1), 1e-10);
    EXPECT_NEAR(sum(toHost(sources.jz)), electrons * factor * pz / gammaM, 1e-10);
}

TEST_F(DepositorTest, EnsembleMismatch) {
    auto other = qsw::makeCoarseLattice(plasmaSteps - 8, h, coarseness);
    qsw::PlasmaParticles<double> small(other, coarseness);
    auto make = [&]() {
        return qsw::Depositor<double>(grid, table, small, coarseness, fineness);
    };
    EXPECT_THROW(make(), QswException);
}

int main(int argc, char* argv[]) {
    int success = 1;
    qsw::initialize(argc, argv);
    {
        ::testing::InitGoogleTest(&argc, argv);
        success = RUN_ALL_TESTS();
    }
    qsw::finalize();
    return success;
}
