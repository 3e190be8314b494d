//
// Unit test SimulationTest
//   Test the slice bookkeeping and the beam evaluation of a run, and the
//   wake of a Gaussian driver over many slices.
//
#include "Qsw.h"

#include <algorithm>
#include <cmath>
#include <vector>

#include "Beam/GaussianBeam.h"
#include "Config/SimulationParameters.h"
#include "Stepper/Simulation.h"

#include "TestUtils.h"
#include "gtest/gtest.h"

class SimulationTest : public ::testing::Test {
public:
    static qsw::SimulationParameters smallRun() {
        qsw::ParameterList p;
        p.add("grid_steps", 21);
        p.add("reflect_padding_steps", 3);
        p.add("plasma_padding_steps", 3);
        p.add("plasma_coarseness", 1);
        p.add("plasma_fineness", 2);
        return qsw::SimulationParameters::fromParameterList(p);
    }

    static qsw::SimulationParameters gaussianRun() {
        qsw::ParameterList p;
        p.add("grid_steps", 65);
        p.add("grid_step_size", 0.15);
        p.add("xi_step_size", 0.1);
        p.add("xi_steps", 100);
        p.add("reflect_padding_steps", 4);
        p.add("plasma_padding_steps", 8);
        p.add("plasma_coarseness", 2);
        p.add("plasma_fineness", 2);
        return qsw::SimulationParameters::fromParameterList(p);
    }
};

TEST_F(SimulationTest, BeamDensityOnGrid) {
    qsw::GridGeometry<double> grid(5, 0.5, 1);
    qsw::grid_view_type<double> beamRo("beam_ro", 5, 5);
    auto beam = [](int xiIndex, double x, double y) { return xiIndex + 10 * x + 100 * y; };
    qsw::fillBeamDensity(beam, 3, grid, beamRo);

    auto host = toHost(beamRo);
    EXPECT_DOUBLE_EQ(host(2, 2), 3);
    EXPECT_DOUBLE_EQ(host(0, 2), 3 - 10);
    EXPECT_DOUBLE_EQ(host(2, 4), 3 + 100);
}

TEST_F(SimulationTest, AdvanceCountsSlices) {
    qsw::Simulation<double> sim(smallRun());
    EXPECT_EQ(sim.xiIndex(), 0);
    EXPECT_EQ(sim.grid().size(), 21);

    std::vector<int> seen;
    auto beam = [&](int xiIndex, double x, double y) {
        if (x == 0 && y == 0) {
            seen.push_back(xiIndex);
        }
        return -0.01 * std::exp(-(x * x + y * y) / 0.005) * xiIndex;
    };
    sim.advance(beam);
    sim.advance(beam);
    EXPECT_EQ(sim.xiIndex(), 2);
    EXPECT_EQ(seen, (std::vector<int>{0, 1}));

    // the first slice has no beam, the second one does
    auto host = sim.state().snapshot();
    EXPECT_GT(maxAbs(host.Ez), 0);
}

TEST_F(SimulationTest, GaussianWakeOnAxis) {
    const auto params = gaussianRun();
    qsw::Simulation<double> sim(params);

    qsw::GaussianBeam beam;
    beam.xiStepSize = params.xiStepSize;

    const int n = params.gridSteps;
    const int c = n / 2;
    ASSERT_DOUBLE_EQ(sim.grid().coordinate(c), 0);

    std::vector<double> ez;
    for (int k = 0; k < params.xiSteps; ++k) {
        sim.advance(beam);
        double value;
        Kokkos::deep_copy(value, Kokkos::subview(sim.state().fields.Ez, c, c));
        ez.push_back(value);
    }
    EXPECT_EQ(sim.xiIndex(), params.xiSteps);

    // nothing in front of the driver
    EXPECT_NEAR(ez[0], 0, 1e-10);

    // a positive driver pulls the electrons inwards, which makes Ez < 0 on its
    // slices; behind it the wake oscillates with the plasma period 2 pi:
    // Ez(0, 0) < 0 at xi = -3, > 0 at xi = -6 and < 0 again at xi = -9
    auto at = [&](double xi) {
        return ez[static_cast<size_t>(std::lround(-xi / params.xiStepSize))];
    };
    const double peak = std::max(std::abs(at(-3)), std::abs(at(-6)));
    EXPECT_GT(peak, 1e-4);
    EXPECT_LT(at(-3), 0);
    EXPECT_GT(at(-6), 0);
    EXPECT_LT(at(-9), 0);

    // two turning points between xi = -1 and the end of the run
    int signChanges = 0;
    for (size_t k = 11; k < ez.size(); ++k) {
        if ((ez[k - 1] < 0) != (ez[k] < 0)) {
            ++signChanges;
        }
    }
    EXPECT_EQ(signChanges, 2);

    // the round driver on the axis keeps the wake round
    auto host          = sim.state().snapshot();
    const double scale = maxAbs(host.Ez);
    ASSERT_GT(scale, 0);
    for (int i = 0; i < n; ++i) {
        for (int j = 0; j < n; ++j) {
            EXPECT_NEAR(host.Ez(i, j), host.Ez(n - 1 - i, j), 1e-7 * scale);
            EXPECT_NEAR(host.Ez(i, j), host.Ez(i, n - 1 - j), 1e-7 * scale);
            EXPECT_NEAR(host.Ez(i, j), host.Ez(j, i), 1e-7 * scale);
            EXPECT_NEAR(host.Ex(i, j), host.Ey(j, i), 1e-7 * maxAbs(host.Ex));
        }
    }
    EXPECT_EQ(maxAbs(host.Bz), 0);
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
