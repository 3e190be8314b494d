//
// Unit test StepDriverTest
//   Test the slice step on a small grid: an empty beam leaves the plasma
//   undisturbed, moving plasma without a beam drifts freely, and a round
//   beam on the axis produces fields with the symmetries of the setup.
//
#include "Qsw.h"

#include <algorithm>
#include <cmath>
#include <sstream>

#include "Config/SimulationParameters.h"
#include "State/SliceState.h"
#include "Stepper/StepDriver.h"
#include "Utility/QswException.h"

#include "TestUtils.h"
#include "gtest/gtest.h"

class StepDriverTest : public ::testing::Test {
public:
    using view_type = qsw::grid_view_type<double>;

    static qsw::SimulationParameters smallRun(bool checkResidual = false,
                                              double residualTolerance = 1e-6) {
        qsw::ParameterList p;
        p.add("grid_steps", n);
        p.add("reflect_padding_steps", 3);
        p.add("plasma_padding_steps", 3);
        p.add("plasma_coarseness", 1);
        p.add("plasma_fineness", 2);
        p.add("check_residual", checkResidual);
        p.add("residual_tolerance", residualTolerance);
        return qsw::SimulationParameters::fromParameterList(p);
    }

    StepDriverTest()
        : driver(smallRun())
        , beam("beam_ro", n, n) {}

    // a round electron beam on the axis
    view_type roundBeam(double amplitude, double sigma) const {
        const auto& g = driver.grid();
        return makeGridView<double>("beam_ro", n, n, [&](int i, int j) {
            const double x = g.coordinate(i);
            const double y = g.coordinate(j);
            return -amplitude * std::exp(-(x * x + y * y) / (2 * sigma * sigma));
        });
    }

    static constexpr int n = 21;

    qsw::StepDriver<double> driver;
    view_type beam;
};

TEST_F(StepDriverTest, InitialStateAtRest) {
    auto state = driver.initialState();
    auto host  = state.snapshot();
    EXPECT_EQ(maxAbs(host.px) + maxAbs(host.py) + maxAbs(host.pz), 0);
    EXPECT_EQ(maxAbs(host.Ex) + maxAbs(host.Ez) + maxAbs(host.ro), 0);
    EXPECT_EQ(host.xOfft.extent(0), static_cast<size_t>(driver.particles().count()));
    EXPECT_EQ(host.Ex.extent(0), static_cast<size_t>(n));
}

TEST_F(StepDriverTest, NoBeamNoWake) {
    auto state = driver.initialState();
    for (int k = 0; k < 3; ++k) {
        state = driver.step(beam, state);
    }

    auto host = state.snapshot();
    for (auto* v : {&host.xOfft, &host.yOfft, &host.px, &host.py, &host.pz}) {
        EXPECT_LT(maxAbs(*v), 1e-10);
    }
    for (auto* v : {&host.Ex, &host.Ey, &host.Ez, &host.Bx, &host.By, &host.Bz}) {
        EXPECT_LT(maxAbs(*v), 1e-9);
    }
    EXPECT_LT(maxAbs(host.ro), 1e-10);
}

TEST_F(StepDriverTest, RoundBeamSymmetry) {
    beam       = roundBeam(0.05, 0.05);
    auto prev  = driver.initialState();
    auto first = driver.step(beam, prev);
    auto state = driver.step(beam, first);

    // the previous slices are left untouched
    EXPECT_EQ(maxAbs(prev.snapshot().Ex), 0);

    auto host = state.snapshot();
    EXPECT_EQ(maxAbs(host.Bz), 0);

    const double scaleE = maxAbs(host.Ex);
    const double scaleZ = maxAbs(host.Ez);
    const double scaleB = maxAbs(host.By);
    ASSERT_GT(scaleE, 0);
    ASSERT_GT(scaleZ, 0);
    ASSERT_GT(scaleB, 0);
    const double tolE = 1e-9 * scaleE;
    const double tolZ = 1e-9 * scaleZ;
    const double tolB = 1e-9 * scaleB;

    for (int i = 0; i < n; ++i) {
        const int mi = n - 1 - i;
        for (int j = 0; j < n; ++j) {
            const int mj = n - 1 - j;

            EXPECT_NEAR(host.Ez(i, j), host.Ez(mi, j), tolZ);
            EXPECT_NEAR(host.Ez(i, j), host.Ez(i, mj), tolZ);
            EXPECT_NEAR(host.Ez(i, j), host.Ez(j, i), tolZ);

            EXPECT_NEAR(host.Ex(i, j), -host.Ex(mi, j), tolE);
            EXPECT_NEAR(host.Ex(i, j), host.Ex(i, mj), tolE);
            EXPECT_NEAR(host.Ey(i, j), -host.Ey(i, mj), tolE);
            EXPECT_NEAR(host.Ex(i, j), host.Ey(j, i), tolE);

            EXPECT_NEAR(host.By(i, j), -host.By(mi, j), tolB);
            EXPECT_NEAR(host.Bx(i, j), -host.By(j, i), tolB);

            EXPECT_NEAR(host.ro(i, j), host.ro(j, i), 1e-12);
        }
    }

    // the longitudinal field vanishes on the perimeter
    for (int k = 0; k < n; ++k) {
        EXPECT_EQ(host.Ez(0, k), 0);
        EXPECT_EQ(host.Ez(n - 1, k), 0);
    }
}

TEST_F(StepDriverTest, ResidualCheck) {
    qsw::StepDriver<double> checked(smallRun(true));
    beam = roundBeam(0.05, 0.05);

    auto state = checked.initialState();
    EXPECT_NO_THROW(state = checked.step(beam, state));

    // the checked run computes the same slice
    auto reference = driver.step(beam, driver.initialState());
    auto a         = state.snapshot();
    auto b         = reference.snapshot();
    for (int i = 0; i < n; ++i) {
        for (int j = 0; j < n; ++j) {
            EXPECT_NEAR(a.Ez(i, j), b.Ez(i, j), 1e-14);
        }
    }
}

TEST_F(StepDriverTest, ResidualAboveToleranceIsReported) {
    std::ostringstream warnings;
    qsw::Warn->setDestination(warnings);

    qsw::StepDriver<double> strict(smallRun(true, 1e-300));
    beam = roundBeam(0.05, 0.05);
    strict.step(beam, strict.initialState());

    qsw::StepDriver<double> loose(smallRun(true, 1.0));
    const auto strictOutput = warnings.str();
    warnings.str("");
    loose.step(beam, loose.initialState());

    qsw::Warn->setDestination(std::cerr);

    EXPECT_NE(strictOutput.find("Relative residual of Ex"), std::string::npos);
    EXPECT_NE(strictOutput.find("Relative residual of Ez"), std::string::npos);
    EXPECT_EQ(warnings.str(), "");
}

TEST_F(StepDriverTest, FreeStreamingWithoutBeam) {
    // walls two cells outside the plasma
    auto params                = smallRun();
    params.plasmaPaddingSteps  = 5;
    params.reflectPaddingSteps = 3;
    qsw::StepDriver<double> drifting(params);

    const int nc   = drifting.particles().count();
    const auto m   = toHost(drifting.particles().m());
    const double d = params.xiStepSize;

    // a plasma moving uniformly along x, with the densities of that motion
    auto moving = [&](double p) {
        auto state = drifting.initialState();
        Kokkos::deep_copy(state.particles.px, p);
        const auto& s = state.particles;
        drifting.depositor().deposit(s.xOfft, s.yOfft, s.px, s.py, s.pz, state.sources.ro,
                                     state.sources.jx, state.sources.jy, state.sources.jz);
        return state;
    };

    const double p = 1e-3;
    auto next      = drifting.step(beam, moving(p)).snapshot();
    auto twice     = drifting.step(beam, moving(2 * p)).snapshot();

    for (int i = 0; i < nc; ++i) {
        for (int j = 0; j < nc; ++j) {
            const double drift = p / std::sqrt(m(i, j) * m(i, j) + p * p) * d;
            EXPECT_NEAR(next.xOfft(i, j), drift, 1e-3 * drift);
            EXPECT_NEAR(next.yOfft(i, j), 0, 1e-3 * drift);
            EXPECT_NEAR(next.px(i, j), p, 1e-3 * p);
            EXPECT_NEAR(next.py(i, j), 0, 1e-3 * p);
            EXPECT_NEAR(next.pz(i, j), 0, 1e-3 * p);
        }
    }

    // only the edges of the moving plasma produce fields, and they are weak
    EXPECT_EQ(maxAbs(next.Bz), 0);
    for (const auto* f : {&next.Ex, &next.Ey, &next.Ez, &next.Bx, &next.By}) {
        EXPECT_LT(maxAbs(*f), 10 * p);
    }

    // the electric fields follow the charge and current of the drift, which
    // are linear in p
    auto linearity = [&](const auto& a, const auto& b) {
        double deviation = 0;
        for (int i = 0; i < n; ++i) {
            for (int j = 0; j < n; ++j) {
                deviation = std::max(deviation, std::abs(b(i, j) - 2 * a(i, j)));
            }
        }
        return deviation / maxAbs(b);
    };
    ASSERT_GT(maxAbs(twice.Ex), 0);
    ASSERT_GT(maxAbs(twice.Ez), 0);
    EXPECT_LT(linearity(next.Ex, twice.Ex), 0.05);
    EXPECT_LT(linearity(next.Ey, twice.Ey), 0.05);
    EXPECT_LT(linearity(next.Ez, twice.Ez), 0.05);
}

TEST_F(StepDriverTest, ShapeMismatch) {
    auto state = driver.initialState();
    view_type small("small_beam", n - 2, n - 2);
    EXPECT_THROW(driver.step(small, state), QswException);

    auto other = qsw::SliceState<double>::zeros(driver.particles().count() + 1, n);
    EXPECT_THROW(driver.step(beam, other), QswException);
}

TEST_F(StepDriverTest, InvalidParameters) {
    auto params      = smallRun();
    params.gridSteps = 20;
    auto make        = [](const qsw::SimulationParameters& p) { qsw::StepDriver<double> d(p); };
    EXPECT_THROW(make(params), QswException);
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
