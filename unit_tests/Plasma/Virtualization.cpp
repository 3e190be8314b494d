//
// Unit test VirtualizationTest
//   Test the coarse-to-fine bilinear interpolation table.
//
#include "Qsw.h"

#include <cmath>

#include "Plasma/PlasmaLattice.h"
#include "Plasma/Virtualization.h"
#include "Utility/QswException.h"

#include "TestUtils.h"
#include "gtest/gtest.h"

class VirtualizationTest : public ::testing::Test {
public:
    VirtualizationTest()
        : coarse(qsw::makeCoarseLattice(steps, h, coarseness))
        , fine(qsw::makeFineLattice(steps, h, fineness))
        , table(coarse, fine, h * coarseness) {}

    // x coordinate of fine particle (fx, fy) reconstructed from the corners
    template <typename Host>
    double reconstruct(const Host& A, const Host& B, const Host& C, const Host& D,
                       int cpx, int cnx, int fx, int fy) const {
        return A(fx, fy) * coarse[cpx] + B(fx, fy) * coarse[cnx] + C(fx, fy) * coarse[cpx]
               + D(fx, fy) * coarse[cnx];
    }

    static constexpr int steps      = 23;
    static constexpr int coarseness = 2;
    static constexpr int fineness   = 3;
    static constexpr double h       = 0.1;

    std::vector<double> coarse, fine;
    qsw::VirtualizationTable<double> table;
};

TEST_F(VirtualizationTest, Shapes) {
    EXPECT_EQ(table.coarseCount(), static_cast<int>(coarse.size()));
    EXPECT_EQ(table.fineCount(), static_cast<int>(fine.size()));
    EXPECT_EQ(static_cast<int>(table.weightA().extent(0)), table.fineCount());
    EXPECT_EQ(static_cast<int>(table.weightD().extent(1)), table.fineCount());
}

TEST_F(VirtualizationTest, PartitionOfUnity) {
    auto A = toHost(table.weightA());
    auto B = toHost(table.weightB());
    auto C = toHost(table.weightC());
    auto D = toHost(table.weightD());

    const int nf = table.fineCount();
    for (int fx = 0; fx < nf; ++fx) {
        for (int fy = 0; fy < nf; ++fy) {
            EXPECT_NEAR(A(fx, fy) + B(fx, fy) + C(fx, fy) + D(fx, fy), 1.0, 1e-12);
            EXPECT_GE(A(fx, fy), 0);
            EXPECT_GE(B(fx, fy), 0);
            EXPECT_GE(C(fx, fy), 0);
            EXPECT_GE(D(fx, fy), 0);
        }
    }
}

TEST_F(VirtualizationTest, ReproducesPositions) {
    auto A    = toHost(table.weightA());
    auto B    = toHost(table.weightB());
    auto C    = toHost(table.weightC());
    auto D    = toHost(table.weightD());
    auto prev = toHost(table.indicesPrev());
    auto next = toHost(table.indicesNext());

    const int nf = table.fineCount();
    const int nc = table.coarseCount();
    for (int fx = 0; fx < nf; ++fx) {
        ASSERT_GE(prev(fx), 0);
        ASSERT_LT(next(fx), nc);
        ASSERT_LE(prev(fx), next(fx));

        const double x = reconstruct(A, B, C, D, prev(fx), next(fx), fx, nf / 2);
        if (fine[fx] < coarse.front()) {
            // beyond the coarse lattice the edge particle is used
            EXPECT_NEAR(x, coarse.front(), 1e-12);
        } else if (fine[fx] > coarse.back()) {
            EXPECT_NEAR(x, coarse.back(), 1e-12);
        } else {
            EXPECT_NEAR(x, fine[fx], 1e-12);
        }
    }
}

TEST_F(VirtualizationTest, CoincidingEdges) {
    // fine particles exactly on the outermost coarse particles
    const std::vector<double> c = {-1, 0, 1};
    const std::vector<double> f = {-1, -0.5, 0.5, 1};
    qsw::VirtualizationTable<double> t(c, f, 1.0);

    auto C    = toHost(t.weightC());
    auto D    = toHost(t.weightD());
    auto prev = toHost(t.indicesPrev());
    auto next = toHost(t.indicesNext());

    // fy = 0 lies on the lower edge, so C and D carry the x influences
    EXPECT_DOUBLE_EQ(C(0, 0) + D(0, 0), 1);
    EXPECT_DOUBLE_EQ(D(0, 0), 1);
    EXPECT_EQ(next(0), 0);

    // the upper edge point belongs entirely to the last coarse particle
    EXPECT_DOUBLE_EQ(D(3, 0), 1);
    EXPECT_EQ(next(3), 2);
    EXPECT_EQ(prev(3), 1);

    EXPECT_DOUBLE_EQ(C(1, 0), 0.5);
    EXPECT_DOUBLE_EQ(D(1, 0), 0.5);
}

TEST_F(VirtualizationTest, Invalid) {
    const std::vector<double> one = {0};
    EXPECT_THROW(qsw::VirtualizationTable<double>(one, fine, 1.0), QswException);
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
