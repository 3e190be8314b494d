//
// Unit test MixedBoundarySolverTest
//   Test the DCT + Thomas solver for -laplace(u) + s * u = rhs with one
//   Dirichlet and one reflecting axis.
//
#include "Qsw.h"

#include <cmath>
#include <random>

#include "FieldSolvers/MixedBoundarySolver.h"
#include "FieldSolvers/ResidualCheck.h"
#include "Utility/QswException.h"

#include "TestUtils.h"
#include "gtest/gtest.h"

class MixedBoundarySolverTest : public ::testing::Test {
public:
    using view_type = qsw::grid_view_type<double>;

    MixedBoundarySolverTest() {}

    /*!
     * Discrete eigenfunction: sine mode a along the sweep axis, cosine mode
     * b along the transform axis
     */
    static double mode(int i, int j, int a, int b, qsw::SweepAxis axis) {
        const int sweep     = axis == qsw::SweepAxis::X ? i : j;
        const int transform = axis == qsw::SweepAxis::X ? j : i;
        return std::sin(pi * a * sweep / (n - 1)) * std::cos(pi * b * transform / (n - 1));
    }

    static double eigenvalue(int a, int b) {
        const double sa = std::sin(pi * a / (2 * (n - 1)));
        const double sb = std::sin(pi * b / (2 * (n - 1)));
        return 4 * (sa * sa + sb * sb) / (h * h);
    }

    void checkMode(qsw::MixedBoundarySolver<double>& solver, double s, int a, int b,
                   qsw::SweepAxis axis) {
        const double lambda = eigenvalue(a, b);
        auto rhs            = makeGridView<double>("rhs", n, n, [&](int i, int j) {
            return (lambda + s) * mode(i, j, a, b, axis);
        });
        view_type out("out", n, n);
        solver.solve(rhs, out, axis);

        auto ho = toHost(out);
        for (int i = 0; i < n; ++i) {
            for (int j = 0; j < n; ++j) {
                ASSERT_NEAR(ho(i, j), mode(i, j, a, b, axis), 1e-11)
                    << "mode (" << a << ", " << b << ") at (" << i << ", " << j << ")";
            }
        }
    }

    /*!
     * Max norm error of the solution of -laplace(u) + s u = (2 (pi / W)^2 + s) u
     * for u = sin(pi r / W) cos(pi c / W), where r runs along the sweep axis and
     * c along the transform axis of a square of width W sampled with m nodes
     */
    static double manufacturedError(int m, double s, qsw::SweepAxis axis) {
        const double width = 1.6;
        const double step  = width / (m - 1);
        const double k     = pi / width;

        auto exact = [&](int i, int j) {
            const int r = axis == qsw::SweepAxis::X ? i : j;
            const int c = axis == qsw::SweepAxis::X ? j : i;
            return std::sin(k * r * step) * std::cos(k * c * step);
        };
        auto rhs = makeGridView<double>("rhs", m, m, [&](int i, int j) {
            return (2 * k * k + s) * exact(i, j);
        });
        view_type out("out", m, m);

        qsw::MixedBoundarySolver<double> solver(m, step, s);
        solver.solve(rhs, out, axis);

        auto ho      = toHost(out);
        double error = 0;
        for (int i = 0; i < m; ++i) {
            for (int j = 0; j < m; ++j) {
                error = std::max(error, std::abs(ho(i, j) - exact(i, j)));
            }
        }
        return error;
    }

    static constexpr double pi = Kokkos::numbers::pi_v<double>;

    static constexpr int n    = 33;
    static constexpr double h = 0.05;
};

TEST_F(MixedBoundarySolverTest, EigenmodesSweepX) {
    const double s = 1.0;
    qsw::MixedBoundarySolver<double> solver(n, h, s);
    for (int a : {1, 2, 7, n - 2}) {
        for (int b : {0, 1, 5, n - 1}) {
            checkMode(solver, s, a, b, qsw::SweepAxis::X);
        }
    }
}

TEST_F(MixedBoundarySolverTest, EigenmodesSweepY) {
    const double s = 1.0;
    qsw::MixedBoundarySolver<double> solver(n, h, s);
    for (int a : {1, 3, 16}) {
        for (int b : {0, 2, 11}) {
            checkMode(solver, s, a, b, qsw::SweepAxis::Y);
        }
    }
}

TEST_F(MixedBoundarySolverTest, EigenmodesWithoutScreening) {
    qsw::MixedBoundarySolver<double> solver(n, h, 0.0);
    checkMode(solver, 0.0, 1, 0, qsw::SweepAxis::X);
    checkMode(solver, 0.0, 4, 9, qsw::SweepAxis::Y);
}

TEST_F(MixedBoundarySolverTest, ResidualOfArbitraryRhs) {
    std::mt19937_64 eng(42);
    std::uniform_real_distribution<double> unif(-1, 1);

    auto rhs = makeGridView<double>("rhs", n, n, [&](int, int) { return unif(eng); });

    for (double s : {0.0, 1.0}) {
        qsw::MixedBoundarySolver<double> solver(n, h, s);
        for (auto axis : {qsw::SweepAxis::X, qsw::SweepAxis::Y}) {
            view_type out("out", n, n);
            solver.solve(rhs, out, axis);

            EXPECT_LT(qsw::mixedResidual(out, rhs, s, h, axis), 1e-10);

            // Dirichlet lines of the sweep axis
            auto ho = toHost(out);
            for (int k = 0; k < n; ++k) {
                if (axis == qsw::SweepAxis::X) {
                    EXPECT_EQ(ho(0, k), 0);
                    EXPECT_EQ(ho(n - 1, k), 0);
                } else {
                    EXPECT_NEAR(ho(k, 0), 0, 1e-14);
                    EXPECT_NEAR(ho(k, n - 1), 0, 1e-14);
                }
            }
        }
    }
}

TEST_F(MixedBoundarySolverTest, TransposedRhsGivesTransposedSolution) {
    std::mt19937_64 eng(7);
    std::uniform_real_distribution<double> unif(-1, 1);

    auto hostRhs = Kokkos::View<double**, Kokkos::HostSpace>("host_rhs", n, n);
    for (int i = 0; i < n; ++i) {
        for (int j = 0; j < n; ++j) {
            hostRhs(i, j) = unif(eng);
        }
    }
    auto rhs  = makeGridView<double>("rhs", n, n, [&](int i, int j) { return hostRhs(i, j); });
    auto rhsT = makeGridView<double>("rhsT", n, n, [&](int i, int j) { return hostRhs(j, i); });

    qsw::MixedBoundarySolver<double> solver(n, h, 1.0);
    view_type outX("outX", n, n), outY("outY", n, n);
    solver.solve(rhs, outX, qsw::SweepAxis::X);
    solver.solve(rhsT, outY, qsw::SweepAxis::Y);

    auto hx = toHost(outX);
    auto hy = toHost(outY);
    for (int i = 0; i < n; ++i) {
        for (int j = 0; j < n; ++j) {
            EXPECT_NEAR(hx(i, j), hy(j, i), 1e-12);
        }
    }
}

TEST_F(MixedBoundarySolverTest, SecondOrderConvergence) {
    for (double s : {0.0, 1.0}) {
        for (auto axis : {qsw::SweepAxis::X, qsw::SweepAxis::Y}) {
            const double coarse = manufacturedError(17, s, axis);
            const double fine   = manufacturedError(33, s, axis);

            EXPECT_LT(coarse, 1e-2);
            EXPECT_GT(coarse / fine, 3.5) << "s = " << s;
            EXPECT_LT(coarse / fine, 4.5) << "s = " << s;
        }
    }
}

TEST_F(MixedBoundarySolverTest, NegativeScreening) {
    EXPECT_THROW(qsw::MixedBoundarySolver<double>(n, h, -1.0), QswException);
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
