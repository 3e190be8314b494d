//
// Unit test PlasmaPusherTest
//   Test the predictor and the field push of the coarse electrons.
//
#include "Qsw.h"

#include <cmath>

#include "Grid/GridGeometry.h"
#include "Plasma/PlasmaParticles.h"
#include "Pusher/PlasmaPusher.h"
#include "State/SliceState.h"

#include "TestUtils.h"
#include "gtest/gtest.h"

class PlasmaPusherTest : public ::testing::Test {
public:
    using view_type = qsw::grid_view_type<double>;

    // 3 x 3 unit electrons at x, y in {-0.2, 0, 0.2}, or shifted by origin
    static qsw::PlasmaParticles<double> electrons(double origin = 0) {
        auto pos = [=](int k) { return origin + 0.2 * (k - 1); };
        return qsw::PlasmaParticles<double>(
            makeGridView<double>("m", nc, nc, [](int, int) { return 1.0; }),
            makeGridView<double>("q", nc, nc, [](int, int) { return -1.0; }),
            makeGridView<double>("x_init", nc, nc, [&](int i, int) { return pos(i); }),
            makeGridView<double>("y_init", nc, nc, [&](int, int j) { return pos(j); }));
    }

    PlasmaPusherTest()
        : grid(n, h, 2)
        , prev(qsw::ParticleState<double>::zeros(nc))
        , next(qsw::ParticleState<double>::zeros(nc))
        , fields(qsw::FieldSet<double>::zeros(n))
        , estX("est_x", nc, nc)
        , estY("est_y", nc, nc) {}

    static constexpr int nc     = 3;
    static constexpr int n      = 21;
    static constexpr double h   = 0.1;
    static constexpr double dxi = 0.05;

    qsw::GridGeometry<double> grid;
    qsw::ParticleState<double> prev, next;
    qsw::FieldSet<double> fields;
    view_type estX, estY;
};

TEST_F(PlasmaPusherTest, ReflectBoundary) {
    EXPECT_DOUBLE_EQ(grid.reflectBoundary(), 0.85);
}

TEST_F(PlasmaPusherTest, FreeDriftMatchesEstimate) {
    qsw::PlasmaPusher<double> pusher(grid, electrons(), dxi);
    Kokkos::deep_copy(prev.px, 0.1);
    Kokkos::deep_copy(prev.py, -0.05);
    Kokkos::deep_copy(prev.pz, 0.02);

    pusher.estimate(prev, estX, estY);
    pusher.push(prev, estX, estY, fields, next);

    const double gammaM = std::sqrt(1 + 0.1 * 0.1 + 0.05 * 0.05 + 0.02 * 0.02);
    auto hx             = toHost(next.xOfft);
    auto hy             = toHost(next.yOfft);
    auto ex             = toHost(estX);
    auto ey             = toHost(estY);
    auto px             = toHost(next.px);
    auto pz             = toHost(next.pz);
    for (int i = 0; i < nc; ++i) {
        for (int j = 0; j < nc; ++j) {
            EXPECT_NEAR(hx(i, j), 0.1 / (gammaM - 0.02) * dxi, 1e-14);
            EXPECT_NEAR(hy(i, j), -0.05 / (gammaM - 0.02) * dxi, 1e-14);
            EXPECT_NEAR(ex(i, j), hx(i, j), 1e-14);
            EXPECT_NEAR(ey(i, j), hy(i, j), 1e-14);
            EXPECT_DOUBLE_EQ(px(i, j), 0.1);
            EXPECT_DOUBLE_EQ(pz(i, j), 0.02);
        }
    }
}

TEST_F(PlasmaPusherTest, WallReflection) {
    // the right column starts at x = 0.8, the wall is at 0.85
    qsw::PlasmaPusher<double> pusher(grid, electrons(0.6), 0.2);
    Kokkos::deep_copy(prev.px, 0.5);

    pusher.estimate(prev, estX, estY);
    pusher.push(prev, estX, estY, fields, next);

    const double dx = 0.5 / std::sqrt(1.25) * 0.2;
    auto ex         = toHost(estX);
    auto hx         = toHost(next.xOfft);
    auto px         = toHost(next.px);
    for (int j = 0; j < nc; ++j) {
        const double xFree = 0.8 + dx;
        EXPECT_NEAR(0.8 + hx(2, j), 2 * 0.85 - xFree, 1e-14);
        EXPECT_NEAR(0.8 + ex(2, j), 2 * 0.85 - xFree, 1e-14);
        EXPECT_DOUBLE_EQ(px(2, j), -0.5);

        // particles that stay inside keep their momentum
        EXPECT_NEAR(hx(1, j), dx, 1e-14);
        EXPECT_DOUBLE_EQ(px(1, j), 0.5);
    }
}

TEST_F(PlasmaPusherTest, UniformTransverseField) {
    qsw::PlasmaPusher<double> pusher(grid, electrons(), dxi);
    const double E = 0.3;
    Kokkos::deep_copy(fields.Ex, E);

    pusher.estimate(prev, estX, estY);
    pusher.push(prev, estX, estY, fields, next);

    // resting electron: dpx = q dxi Ex, the position moves with the half step momentum
    const double dpx   = -dxi * E;
    const double pHalf = dpx / 2;
    auto hx            = toHost(next.xOfft);
    auto hy            = toHost(next.yOfft);
    auto px            = toHost(next.px);
    auto py            = toHost(next.py);
    auto pz            = toHost(next.pz);
    for (int i = 0; i < nc; ++i) {
        for (int j = 0; j < nc; ++j) {
            EXPECT_NEAR(px(i, j), dpx, 1e-14);
            EXPECT_NEAR(py(i, j), 0, 1e-14);
            EXPECT_NEAR(pz(i, j), 0, 1e-14);
            EXPECT_NEAR(hx(i, j), pHalf / std::sqrt(1 + pHalf * pHalf) * dxi, 1e-14);
            EXPECT_NEAR(hy(i, j), 0, 1e-14);
        }
    }
}

TEST_F(PlasmaPusherTest, UniformLongitudinalField) {
    qsw::PlasmaPusher<double> pusher(grid, electrons(), dxi);
    const double E = 0.4;
    Kokkos::deep_copy(fields.Ez, E);

    pusher.estimate(prev, estX, estY);
    pusher.push(prev, estX, estY, fields, next);

    // the first iteration sees pz = 0, the second the half step of the first
    const double pzHalf = -dxi * E / 2;
    const double gammaM = std::sqrt(1 + pzHalf * pzHalf);
    const double dpz    = -dxi * E / (1 - pzHalf / gammaM);
    auto pz             = toHost(next.pz);
    auto hx             = toHost(next.xOfft);
    for (int i = 0; i < nc; ++i) {
        for (int j = 0; j < nc; ++j) {
            EXPECT_NEAR(pz(i, j), dpz, 1e-14);
            EXPECT_NEAR(hx(i, j), 0, 1e-14);
        }
    }
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
