//
// Unit test OnAxisHistoryTest
//   Test the peak detection and the peak report of the on-axis history.
//
#include "Qsw.h"

#include <cmath>
#include <vector>

#include "Diagnostics/OnAxisHistory.h"
#include "Utility/QswException.h"

#include "gtest/gtest.h"

class OnAxisHistoryTest : public ::testing::Test {
public:
    void record(const std::vector<double>& values) {
        for (double v : values) {
            history.record(v);
        }
    }

    qsw::OnAxisHistory history;
};

TEST_F(OnAxisHistoryTest, Empty) {
    EXPECT_TRUE(history.empty());
    EXPECT_THROW(history.last(), QswException);
    EXPECT_TRUE(history.peakIndices().empty());
    EXPECT_EQ(history.peakReport(), "...");
}

TEST_F(OnAxisHistoryTest, NoPeakYet) {
    record({0.0, 0.1, 0.2, 0.3});
    EXPECT_DOUBLE_EQ(history.last(), 0.3);
    EXPECT_EQ(history.peakReport(), "...");

    // a plateau is not a strict maximum
    record({0.3, 0.2});
    EXPECT_TRUE(history.peakIndices().empty());
}

TEST_F(OnAxisHistoryTest, SinglePeak) {
    record({0.0, 1.0, 0.5});
    ASSERT_EQ(history.peakIndices(), std::vector<std::size_t>{1});
    EXPECT_EQ(history.peakReport(), "1.0000e+00 +0.00%");
}

TEST_F(OnAxisHistoryTest, DecayingWake) {
    for (int k = 0; k < 400; ++k) {
        history.record(std::exp(-k / 1000.0) * std::sin(k * 0.1));
    }
    const auto peaks = history.peakIndices();
    ASSERT_GE(peaks.size(), 2u);
    EXPECT_LT(history.values()[peaks.back()], history.values()[peaks.front()]);
    EXPECT_EQ(history.peakReport().back(), '%');
    EXPECT_NE(history.peakReport().find(" -"), std::string::npos);
}

TEST_F(OnAxisHistoryTest, GrowingPeak) {
    record({0.0, 2.0, 0.0, 2.5, 0.0});
    EXPECT_EQ(history.peakReport(), "2.5000e+00 +25.00%");
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
