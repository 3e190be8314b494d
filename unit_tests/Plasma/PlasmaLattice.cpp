//
// Unit test PlasmaLatticeTest
//   Test the coarse and fine plasma lattices and the coarse ensemble.
//
#include "Qsw.h"

#include <algorithm>
#include <cmath>

#include "Plasma/PlasmaLattice.h"
#include "Plasma/PlasmaParticles.h"
#include "Utility/QswException.h"

#include "TestUtils.h"
#include "gtest/gtest.h"

class PlasmaLatticeTest : public ::testing::Test {
public:
    PlasmaLatticeTest() {}

    static void expectAntisymmetric(const std::vector<double>& lattice) {
        const size_t n = lattice.size();
        for (size_t k = 0; k < n; ++k) {
            EXPECT_DOUBLE_EQ(lattice[k], -lattice[n - 1 - k]);
        }
    }

    static void expectIncreasing(const std::vector<double>& lattice, double spacing) {
        for (size_t k = 1; k < lattice.size(); ++k) {
            EXPECT_NEAR(lattice[k] - lattice[k - 1], spacing, 1e-12);
        }
    }

    const double h = 0.025;
};

TEST_F(PlasmaLatticeTest, Coarse) {
    // 15 cells, one particle every cell: 7 on each side of the axis plus the axis
    auto coarse = qsw::makeCoarseLattice(15, h, 1);
    ASSERT_EQ(coarse.size(), 13u);
    EXPECT_DOUBLE_EQ(coarse[6], 0);
    EXPECT_NEAR(coarse.back(), 6 * h, 1e-12);
    expectAntisymmetric(coarse);
    expectIncreasing(coarse, h);

    // reference run: 621 cells, coarseness 3
    coarse = qsw::makeCoarseLattice(621, h, 3);
    ASSERT_EQ(coarse.size(), 205u);
    expectAntisymmetric(coarse);
    expectIncreasing(coarse, 3 * h);
}

TEST_F(PlasmaLatticeTest, FineEven) {
    auto fine = qsw::makeFineLattice(15, h, 2);
    ASSERT_EQ(fine.size(), 28u);
    expectAntisymmetric(fine);
    expectIncreasing(fine, h / 2);

    // no particle on the axis or on a cell corner
    EXPECT_TRUE(std::none_of(fine.begin(), fine.end(), [](double x) { return x == 0; }));
    EXPECT_NEAR(fine[14], h / 4, 1e-12);
}

TEST_F(PlasmaLatticeTest, FineOdd) {
    auto fine = qsw::makeFineLattice(15, h, 3);
    ASSERT_EQ(fine.size(), 41u);
    expectAntisymmetric(fine);
    expectIncreasing(fine, h / 3);
    EXPECT_DOUBLE_EQ(fine[20], 0);
}

TEST_F(PlasmaLatticeTest, Invalid) {
    EXPECT_THROW(qsw::makeCoarseLattice(15, h, 0), QswException);
    EXPECT_THROW(qsw::makeCoarseLattice(3, h, 2), QswException);
    EXPECT_THROW(qsw::makeFineLattice(15, h, 0), QswException);
    EXPECT_THROW(qsw::makeFineLattice(1, h, 2), QswException);
}

TEST_F(PlasmaLatticeTest, Particles) {
    const int coarseness = 3;
    const auto coarse    = qsw::makeCoarseLattice(39, h, coarseness);
    const int nc         = coarse.size();

    qsw::PlasmaParticles<double> particles(coarse, coarseness);
    ASSERT_EQ(particles.count(), nc);

    auto m  = toHost(particles.m());
    auto q  = toHost(particles.q());
    auto xi = toHost(particles.xInit());
    auto yi = toHost(particles.yInit());
    for (int i = 0; i < nc; ++i) {
        for (int j = 0; j < nc; ++j) {
            EXPECT_DOUBLE_EQ(m(i, j), 9);
            EXPECT_DOUBLE_EQ(q(i, j), -9);
            EXPECT_DOUBLE_EQ(xi(i, j), coarse[i]);
            EXPECT_DOUBLE_EQ(yi(i, j), coarse[j]);
        }
    }
}

TEST_F(PlasmaLatticeTest, ParticlesShapeMismatch) {
    qsw::grid_view_type<double> a("a", 3, 3), b("b", 3, 3), c("c", 3, 3), d("d", 3, 4);
    auto make = [&](const qsw::grid_view_type<double>& yInit) {
        return qsw::PlasmaParticles<double>(a, b, c, yInit);
    };
    EXPECT_THROW(make(d), QswException);
    EXPECT_NO_THROW(make(c));
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
