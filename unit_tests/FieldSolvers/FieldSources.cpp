//
// Unit test FieldSourcesTest
//   Test the right hand sides of the transverse field equations.
//
#include "Qsw.h"

#include "FieldSolvers/FieldSources.h"
#include "Grid/GridGeometry.h"
#include "State/SliceState.h"

#include "TestUtils.h"
#include "gtest/gtest.h"

class FieldSourcesTest : public ::testing::Test {
public:
    using view_type = qsw::grid_view_type<double>;

    FieldSourcesTest()
        : grid(n, h, 3)
        , sources(grid, dxi, s)
        , current(qsw::SourceSet<double>::zeros(n))
        , previous(qsw::SourceSet<double>::zeros(n))
        , sub(qsw::FieldSet<double>::zeros(n))
        , rhs(qsw::FieldSet<double>::zeros(n))
        , beam("beam", n, n) {}

    static bool inner(int k) { return k > 0 && k < n - 1; }

    static constexpr int n      = 15;
    static constexpr double h   = 0.1;
    static constexpr double dxi = 0.01;
    static constexpr double s   = 0.5;

    qsw::GridGeometry<double> grid;
    qsw::FieldSources<double> sources;
    qsw::SourceSet<double> current, previous;
    qsw::FieldSet<double> sub, rhs;
    view_type beam;
};

TEST_F(FieldSourcesTest, ChargeGradient) {
    // rho = 2 x, beam = 3 y
    auto& g        = grid;
    current.ro     = makeGridView<double>("ro", n, n, [&](int i, int) { return 2 * g.coordinate(i); });
    beam           = makeGridView<double>("beam", n, n, [&](int, int j) { return 3 * g.coordinate(j); });
    sources.mixed(current, previous, beam, sub, rhs);

    auto ex = toHost(rhs.Ex);
    auto ey = toHost(rhs.Ey);
    auto bx = toHost(rhs.Bx);
    auto by = toHost(rhs.By);
    for (int i = 0; i < n; ++i) {
        for (int j = 0; j < n; ++j) {
            EXPECT_NEAR(ex(i, j), inner(i) ? -2.0 : 0.0, 1e-12);
            EXPECT_NEAR(ey(i, j), inner(j) ? -3.0 : 0.0, 1e-12);
            // the beam also carries current along z
            EXPECT_NEAR(bx(i, j), inner(j) ? 3.0 : 0.0, 1e-12);
            EXPECT_NEAR(by(i, j), 0.0, 1e-12);
        }
    }
}

TEST_F(FieldSourcesTest, LongitudinalCurrentChange) {
    Kokkos::deep_copy(previous.jx, 1.0);
    Kokkos::deep_copy(current.jy, 2.0);
    sources.mixed(current, previous, beam, sub, rhs);

    auto ex = toHost(rhs.Ex);
    auto ey = toHost(rhs.Ey);
    auto bx = toHost(rhs.Bx);
    auto by = toHost(rhs.By);
    for (int i = 0; i < n; ++i) {
        for (int j = 0; j < n; ++j) {
            EXPECT_NEAR(ex(i, j), 1 / dxi, 1e-9);
            EXPECT_NEAR(ey(i, j), -2 / dxi, 1e-9);
            EXPECT_NEAR(bx(i, j), 2 / dxi, 1e-9);
            EXPECT_NEAR(by(i, j), 1 / dxi, 1e-9);
        }
    }
}

TEST_F(FieldSourcesTest, ScreeningTerm) {
    Kokkos::deep_copy(sub.Ex, 1.0);
    Kokkos::deep_copy(sub.Ey, 2.0);
    Kokkos::deep_copy(sub.Bx, 3.0);
    Kokkos::deep_copy(sub.By, 4.0);
    sources.mixed(current, previous, beam, sub, rhs);

    auto ex = toHost(rhs.Ex);
    auto ey = toHost(rhs.Ey);
    auto bx = toHost(rhs.Bx);
    auto by = toHost(rhs.By);
    EXPECT_DOUBLE_EQ(ex(3, 4), s * 1);
    EXPECT_DOUBLE_EQ(ey(0, 0), s * 2);
    EXPECT_DOUBLE_EQ(bx(7, 7), s * 3);
    EXPECT_DOUBLE_EQ(by(n - 1, 2), s * 4);
}

TEST_F(FieldSourcesTest, Divergence) {
    auto& g    = grid;
    current.jx = makeGridView<double>("jx", n, n, [&](int i, int) { return 5 * g.coordinate(i); });
    current.jy = makeGridView<double>("jy", n, n, [&](int, int j) {
        return -g.coordinate(j) * g.coordinate(j);
    });
    view_type ez("ez_rhs", n, n);
    Kokkos::deep_copy(ez, 1.0);
    sources.longitudinal(current, ez);

    auto he = toHost(ez);
    for (int i = 0; i < n; ++i) {
        for (int j = 0; j < n; ++j) {
            if (inner(i) && inner(j)) {
                // d(-y^2)/dy = -2y, exact for centered differences
                EXPECT_NEAR(he(i, j), -(5 - 2 * g.coordinate(j)), 1e-12);
            } else {
                EXPECT_EQ(he(i, j), 0);
            }
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
