//
// Unit test SliceStateTest
//   Test allocation, deep copies and host snapshots of the slice state.
//
#include "Qsw.h"

#include "State/SliceState.h"

#include "TestUtils.h"
#include "gtest/gtest.h"

template <typename T>
class SliceStateTest : public ::testing::Test {};

using Precisions = TestParams::tests;
TYPED_TEST_SUITE(SliceStateTest, Precisions);

TYPED_TEST(SliceStateTest, Zeros) {
    using T    = TypeParam;
    auto state = qsw::SliceState<T>::zeros(4, 7);

    EXPECT_EQ(state.particles.pz.extent(0), 4u);
    EXPECT_EQ(state.particles.pz.extent(1), 4u);
    EXPECT_EQ(state.fields.Bz.extent(0), 7u);
    EXPECT_EQ(state.sources.jz.extent(1), 7u);

    auto host = state.snapshot();
    EXPECT_EQ(maxAbs(host.xOfft) + maxAbs(host.Ez) + maxAbs(host.ro), 0);
}

TYPED_TEST(SliceStateTest, CloneIsIndependent) {
    using T     = TypeParam;
    auto fields = qsw::FieldSet<T>::zeros(5);
    Kokkos::deep_copy(fields.Ey, T(2));

    auto copy = fields.clone();
    Kokkos::deep_copy(fields.Ey, T(-1));

    auto host = toHost(copy.Ey);
    assertEqual<T>(host(3, 1), T(2));
    EXPECT_NE(copy.Ey.data(), fields.Ey.data());

    auto particles = qsw::ParticleState<T>::zeros(3);
    Kokkos::deep_copy(particles.px, T(0.5));
    auto pcopy = particles.clone();
    Kokkos::deep_copy(particles.px, T(0));
    assertEqual<T>(toHost(pcopy.px)(2, 2), T(0.5));
}

TYPED_TEST(SliceStateTest, SnapshotIsIndependent) {
    using T    = TypeParam;
    auto state = qsw::SliceState<T>::zeros(3, 5);
    Kokkos::deep_copy(state.sources.ro, T(1.5));

    auto host = state.snapshot();
    Kokkos::deep_copy(state.sources.ro, T(0));
    assertEqual<T>(host.ro(4, 4), T(1.5));
    assertEqual<T>(host.jx(0, 0), T(0));
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
