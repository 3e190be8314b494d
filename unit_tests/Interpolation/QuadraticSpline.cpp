//
// Unit test QuadraticSplineTest
//   Test the 9-point scatter and gather of the quadratic spline.
//
#include "Qsw.h"

#include <cmath>
#include <utility>

#include "Grid/GridGeometry.h"
#include "Interpolation/QuadraticSpline.h"

#include "TestUtils.h"
#include "gtest/gtest.h"

template <typename T>
class QuadraticSplineTest : public ::testing::Test {
public:
    using value_type = T;

    QuadraticSplineTest()
        : grid(n, T(0.1), 2) {}

    // a few positions in the grid interior, including nodes and cell edges
    std::vector<std::pair<T, T>> positions() const {
        return {{T(0), T(0)},        {T(0.05), T(-0.05)}, {T(0.123), T(0.377)},
                {T(-0.49), T(0.21)}, {T(0.7), T(-0.66)},  {T(-0.349), T(-0.051)}};
    }

    static constexpr int n = 21;
    qsw::GridGeometry<T> grid;
};

TYPED_TEST_SUITE(QuadraticSplineTest, TestParams::tests);

TYPED_TEST(QuadraticSplineTest, WeightsSumToOne) {
    using T = typename TestFixture::value_type;

    for (const auto& [x, y] : this->positions()) {
        const auto s = qsw::detail::splineStencil(x, y, this->n, this->grid.stepSize());
        EXPECT_EQ(s.i, this->grid.nearestIndex(x));
        EXPECT_EQ(s.j, this->grid.nearestIndex(y));

        T sx = 0, sy = 0, firstMoment = 0;
        for (int k = 0; k < 3; ++k) {
            sx += s.wx[k];
            sy += s.wy[k];
            firstMoment += s.wx[k] * this->grid.coordinate(s.i + k - 1);
        }
        EXPECT_NEAR(sx, 1, 10 * tolerance<T>);
        EXPECT_NEAR(sy, 1, 10 * tolerance<T>);
        // linear functions are reproduced
        EXPECT_NEAR(firstMoment, x, 100 * tolerance<T>);
    }
}

TYPED_TEST(QuadraticSplineTest, ScatterConservesAndGatherIsAdjoint) {
    using T         = typename TestFixture::value_type;
    using view_type = qsw::grid_view_type<T>;

    const int n = this->n;
    const T h   = this->grid.stepSize();
    auto pos    = this->positions();
    const int np = pos.size();

    Kokkos::View<T*> xs("xs", np), ys("ys", np);
    auto hx = Kokkos::create_mirror_view(xs);
    auto hy = Kokkos::create_mirror_view(ys);
    for (int p = 0; p < np; ++p) {
        hx(p) = pos[p].first;
        hy(p) = pos[p].second;
    }
    Kokkos::deep_copy(xs, hx);
    Kokkos::deep_copy(ys, hy);

    // a smooth test field
    auto field = makeGridView<T>("field", n, n, [&](int i, int j) {
        return std::sin(T(0.3) * i) + T(0.1) * j * j;
    });

    view_type scattered("scattered", n, n);
    Kokkos::View<T*> gathered("gathered", np);
    Kokkos::parallel_for(
        "scatterGather", np, KOKKOS_LAMBDA(const int p) {
            const auto s          = qsw::detail::splineStencil(xs(p), ys(p), n, h);
            constexpr auto points = std::make_index_sequence<9>{};
            qsw::detail::scatterToField(points, scattered, s, T(p + 1));
            gathered(p) = qsw::detail::gatherFromField(points, field, s);
        });
    Kokkos::fence();

    auto hs = toHost(scattered);
    auto hf = toHost(field);
    auto hg = toHost(gathered);

    // total charge is conserved
    EXPECT_NEAR(sum(hs), np * (np + 1) / 2.0, 1000 * tolerance<T>);

    // <field, scatter(q)> = sum_p q_p * gather(field)_p
    double lhs = 0, rhs = 0;
    for (int i = 0; i < n; ++i) {
        for (int j = 0; j < n; ++j) {
            lhs += hf(i, j) * hs(i, j);
        }
    }
    for (int p = 0; p < np; ++p) {
        rhs += (p + 1) * hg(p);
    }
    EXPECT_NEAR(lhs, rhs, 1e4 * tolerance<T> * std::abs(rhs));
}

TYPED_TEST(QuadraticSplineTest, GatherReproducesLinearField) {
    using T = typename TestFixture::value_type;

    const int n = this->n;
    auto& grid  = this->grid;
    auto field  = makeGridView<T>("linear", n, n, [&](int i, int j) {
        return 2 * grid.coordinate(i) - 3 * grid.coordinate(j) + 1;
    });
    auto hf = toHost(field);

    constexpr auto points = std::make_index_sequence<9>{};
    for (const auto& [x, y] : this->positions()) {
        const auto s = qsw::detail::splineStencil(x, y, n, grid.stepSize());
        const T v    = qsw::detail::gatherFromField(points, hf, s);
        EXPECT_NEAR(v, 2 * x - 3 * y + 1, 1000 * tolerance<T>);
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
