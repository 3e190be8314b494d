//
// Unit test QswTimingsTest
//   Test the named timer registry.
//
#include "Qsw.h"

#include "Utility/QswTimings.h"

#include "gtest/gtest.h"

class QswTimingsTest : public ::testing::Test {};

TEST_F(QswTimingsTest, SameNameSameTimer) {
    auto a = QswTimings::getTimer("deposit_test");
    auto b = QswTimings::getTimer("deposit_test");
    auto c = QswTimings::getTimer("push_test");
    EXPECT_EQ(a, b);
    EXPECT_NE(a, c);
    EXPECT_EQ(QswTimings::infoTimer("unknown_test"), nullptr);
}

TEST_F(QswTimingsTest, CountsAndClears) {
    auto t = QswTimings::getTimer("step_test");
    for (int k = 0; k < 3; ++k) {
        QswTimings::startTimer(t);
        // a second start of a running timer is ignored
        QswTimings::startTimer(t);
        QswTimings::stopTimer(t);
    }
    // stopping a stopped timer is ignored
    QswTimings::stopTimer(t);

    auto* info = QswTimings::infoTimer("step_test");
    ASSERT_NE(info, nullptr);
    EXPECT_EQ(info->calls, 3u);
    EXPECT_GE(info->wallTime, 0.0);
    EXPECT_FALSE(info->running);

    QswTimings::clearTimer(t);
    EXPECT_EQ(info->calls, 0u);
    EXPECT_EQ(info->wallTime, 0.0);
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
