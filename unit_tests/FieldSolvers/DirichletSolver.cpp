//
// Unit test DirichletSolverTest
//   Test the DST + Thomas solver for -laplace(u) = rhs with u = 0 on the
//   perimeter.
//
#include "Qsw.h"

#include <cmath>
#include <random>

#include "FieldSolvers/DirichletSolver.h"
#include "FieldSolvers/ResidualCheck.h"

#include "TestUtils.h"
#include "gtest/gtest.h"

class DirichletSolverTest : public ::testing::Test {
public:
    using view_type = qsw::grid_view_type<double>;

    DirichletSolverTest() {}

    /*!
     * Max norm error of the solution of -laplace(u) = 2 (pi / W)^2 u for
     * u = sin(pi x / W) sin(pi y / W) on a square of width W sampled with n nodes
     */
    static double manufacturedError(int n) {
        const double width = 1.6;
        const double h     = width / (n - 1);
        const double k     = pi / width;

        auto exact = [&](int i, int j) { return std::sin(k * i * h) * std::sin(k * j * h); };
        auto rhs   = makeGridView<double>("rhs", n, n,
                                          [&](int i, int j) { return 2 * k * k * exact(i, j); });
        view_type out("out", n, n);

        qsw::DirichletSolver<double> solver(n, h);
        solver.solve(rhs, out);

        auto ho      = toHost(out);
        double error = 0;
        for (int i = 0; i < n; ++i) {
            for (int j = 0; j < n; ++j) {
                error = std::max(error, std::abs(ho(i, j) - exact(i, j)));
            }
        }
        return error;
    }

    static constexpr double pi = Kokkos::numbers::pi_v<double>;

    static constexpr int n    = 33;
    static constexpr double h = 0.05;
};

TEST_F(DirichletSolverTest, Eigenmodes) {
    qsw::DirichletSolver<double> solver(n, h);

    for (int a : {1, 2, 9, n - 2}) {
        for (int b : {1, 4, n - 2}) {
            const double sa     = std::sin(pi * a / (2 * (n - 1)));
            const double sb     = std::sin(pi * b / (2 * (n - 1)));
            const double lambda = 4 * (sa * sa + sb * sb) / (h * h);

            auto mode = [&](int i, int j) {
                return std::sin(pi * a * i / (n - 1)) * std::sin(pi * b * j / (n - 1));
            };
            auto rhs = makeGridView<double>("rhs", n, n,
                                            [&](int i, int j) { return lambda * mode(i, j); });
            view_type out("out", n, n);
            solver.solve(rhs, out);

            auto ho = toHost(out);
            for (int i = 0; i < n; ++i) {
                for (int j = 0; j < n; ++j) {
                    ASSERT_NEAR(ho(i, j), mode(i, j), 1e-11)
                        << "mode (" << a << ", " << b << ") at (" << i << ", " << j << ")";
                }
            }
        }
    }
}

TEST_F(DirichletSolverTest, ResidualAndBoundary) {
    std::mt19937_64 eng(1234);
    std::uniform_real_distribution<double> unif(-1, 1);

    // the perimeter of the right hand side is ignored
    auto rhs = makeGridView<double>("rhs", n, n, [&](int i, int j) {
        return (i == 0 || j == 0 || i == n - 1 || j == n - 1) ? 0.0 : unif(eng);
    });
    view_type out("out", n, n);
    Kokkos::deep_copy(out, 1.0);

    qsw::DirichletSolver<double> solver(n, h);
    solver.solve(rhs, out);

    EXPECT_LT(qsw::dirichletResidual(out, rhs, h), 1e-10);

    auto ho = toHost(out);
    for (int k = 0; k < n; ++k) {
        EXPECT_EQ(ho(0, k), 0);
        EXPECT_EQ(ho(n - 1, k), 0);
        EXPECT_EQ(ho(k, 0), 0);
        EXPECT_EQ(ho(k, n - 1), 0);
    }
}

TEST_F(DirichletSolverTest, SecondOrderConvergence) {
    const double coarse = manufacturedError(17);
    const double fine   = manufacturedError(33);

    EXPECT_LT(coarse, 1e-2);
    EXPECT_GT(coarse / fine, 3.5);
    EXPECT_LT(coarse / fine, 4.5);
}

TEST_F(DirichletSolverTest, Linearity) {
    auto rhs1 = makeGridView<double>("rhs1", n, n, [](int i, int j) { return std::sin(i + j); });
    auto rhs2 = makeGridView<double>("rhs2", n, n, [](int i, int j) { return 0.01 * i * j; });
    auto both = makeGridView<double>("both", n, n, [](int i, int j) {
        return 2 * std::sin(i + j) - 3 * 0.01 * i * j;
    });

    qsw::DirichletSolver<double> solver(n, h);
    view_type u1("u1", n, n), u2("u2", n, n), u("u", n, n);
    solver.solve(rhs1, u1);
    solver.solve(rhs2, u2);
    solver.solve(both, u);

    auto h1 = toHost(u1);
    auto h2 = toHost(u2);
    auto hu = toHost(u);
    for (int i = 0; i < n; ++i) {
        for (int j = 0; j < n; ++j) {
            EXPECT_NEAR(hu(i, j), 2 * h1(i, j) - 3 * h2(i, j), 1e-12);
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
