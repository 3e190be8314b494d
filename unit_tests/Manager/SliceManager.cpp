//
// Unit test SliceManagerTest
//   Test the slice loop: hook order, slice indices, the diagnostics cadence
//   and resuming a run in parts.
//
#include "Qsw.h"

#include <string>
#include <vector>

#include "Manager/SliceManager.h"
#include "Utility/QswException.h"

#include "gtest/gtest.h"

class RecordingManager : public qsw::SliceManager {
public:
    RecordingManager(int xiSteps, int each)
        : qsw::SliceManager(xiSteps, each) {}

    void pre_step(int xiIndex) override { calls.push_back("pre " + std::to_string(xiIndex)); }

    void advance(int xiIndex) override {
        calls.push_back("advance " + std::to_string(xiIndex));
        advanced.push_back(xiIndex);
    }

    void post_step(int xiIndex) override { calls.push_back("post " + std::to_string(xiIndex)); }

    void diagnose(int xiIndex) override { diagnosed.push_back(xiIndex); }

    std::vector<std::string> calls;
    std::vector<int> advanced;
    std::vector<int> diagnosed;
};

TEST(SliceManagerTest, HookOrder) {
    RecordingManager manager(2, 1);
    EXPECT_EQ(manager.run(), 2);
    EXPECT_EQ(manager.calls, (std::vector<std::string>{"pre 0", "advance 0", "post 0", "pre 1",
                                                        "advance 1", "post 1"}));
    EXPECT_TRUE(manager.finished());
}

TEST(SliceManagerTest, DiagnosticsCadence) {
    RecordingManager manager(11, 4);
    manager.run();

    // every fourth slice and the last one
    EXPECT_EQ(manager.diagnosed, (std::vector<int>{0, 4, 8, 10}));
    EXPECT_TRUE(manager.isDiagnosticsSlice(8));
    EXPECT_FALSE(manager.isDiagnosticsSlice(9));
}

TEST(SliceManagerTest, LastSliceOnCadence) {
    RecordingManager manager(9, 4);
    manager.run();
    EXPECT_EQ(manager.diagnosed, (std::vector<int>{0, 4, 8}));
}

TEST(SliceManagerTest, RunInParts) {
    RecordingManager manager(7, 3);
    EXPECT_EQ(manager.run(3), 3);
    EXPECT_EQ(manager.xiIndex(), 3);
    EXPECT_FALSE(manager.finished());

    // never past the end of the run
    EXPECT_EQ(manager.run(10), 4);
    EXPECT_EQ(manager.run(10), 0);
    EXPECT_EQ(manager.run(-2), 0);

    EXPECT_EQ(manager.advanced, (std::vector<int>{0, 1, 2, 3, 4, 5, 6}));
    EXPECT_EQ(manager.diagnosed, (std::vector<int>{0, 3, 6}));
}

TEST(SliceManagerTest, EmptyRun) {
    RecordingManager manager(0, 5);
    EXPECT_EQ(manager.run(), 0);
    EXPECT_TRUE(manager.calls.empty());
    EXPECT_TRUE(manager.diagnosed.empty());
}

TEST(SliceManagerTest, InvalidCadence) {
    auto make = [](int xiSteps, int each) { RecordingManager m(xiSteps, each); };
    EXPECT_THROW(make(10, 0), QswException);
    EXPECT_THROW(make(-1, 1), QswException);
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
