//
// Unit test SimulationParametersTest
//   Test the defaults and the validation of the run configuration.
//
#include "Qsw.h"

#include "Config/SimulationParameters.h"
#include "Utility/QswException.h"

#include "gtest/gtest.h"

class SimulationParametersTest : public ::testing::Test {
public:
    SimulationParametersTest() {}

    // a small but valid configuration
    static qsw::SimulationParameters smallRun() {
        qsw::ParameterList p;
        p.add("grid_steps", 21);
        p.add("reflect_padding_steps", 3);
        p.add("plasma_padding_steps", 3);
        p.add("plasma_coarseness", 1);
        p.add("plasma_fineness", 2);
        return qsw::SimulationParameters::fromParameterList(p);
    }
};

TEST_F(SimulationParametersTest, Defaults) {
    const auto sp = qsw::SimulationParameters::fromParameterList(qsw::ParameterList());

    EXPECT_EQ(sp.gridSteps, 641);
    EXPECT_DOUBLE_EQ(sp.gridStepSize, 0.025);
    EXPECT_DOUBLE_EQ(sp.xiStepSize, 0.005);
    EXPECT_EQ(sp.xiSteps, 600000);
    EXPECT_DOUBLE_EQ(sp.subtractionTrick, 1.0);
    EXPECT_EQ(sp.reflectPaddingSteps, 5);
    EXPECT_EQ(sp.plasmaPaddingSteps, 10);
    EXPECT_EQ(sp.plasmaCoarseness, 3);
    EXPECT_EQ(sp.plasmaFineness, 2);
    EXPECT_FALSE(sp.checkResidual);
    EXPECT_EQ(sp.diagnosticsEachNSteps, 200);
    EXPECT_EQ(sp.plasmaSteps(), 621);

    EXPECT_NO_THROW(sp.validate());
}

TEST_F(SimulationParametersTest, Overrides) {
    const auto sp = smallRun();
    EXPECT_EQ(sp.gridSteps, 21);
    EXPECT_EQ(sp.plasmaCoarseness, 1);
    EXPECT_DOUBLE_EQ(sp.gridStepSize, 0.025);
    EXPECT_NO_THROW(sp.validate());

    // the round trip through a parameter list keeps every value
    const auto back = qsw::SimulationParameters::fromParameterList(sp.toParameterList());
    EXPECT_EQ(back.gridSteps, sp.gridSteps);
    EXPECT_EQ(back.reflectPaddingSteps, sp.reflectPaddingSteps);
    EXPECT_DOUBLE_EQ(back.xiStepSize, sp.xiStepSize);
}

TEST_F(SimulationParametersTest, RejectsEvenGrid) {
    auto sp      = smallRun();
    sp.gridSteps = 22;
    EXPECT_THROW(sp.validate(), QswException);
}

TEST_F(SimulationParametersTest, RejectsTinyGrid) {
    auto sp      = smallRun();
    sp.gridSteps = 3;
    EXPECT_THROW(sp.validate(), QswException);
}

TEST_F(SimulationParametersTest, RejectsNonPositiveSteps) {
    auto sp         = smallRun();
    sp.gridStepSize = 0;
    EXPECT_THROW(sp.validate(), QswException);

    sp            = smallRun();
    sp.xiStepSize = -0.005;
    EXPECT_THROW(sp.validate(), QswException);
}

TEST_F(SimulationParametersTest, RejectsNarrowReflectPadding) {
    // the walls must keep the coarse particles' stencils on the grid
    auto sp                = smallRun();
    sp.plasmaCoarseness    = 2;
    sp.reflectPaddingSteps = 3;
    EXPECT_THROW(sp.validate(), QswException);
}

TEST_F(SimulationParametersTest, RejectsPlasmaOutsideWalls) {
    auto sp               = smallRun();
    sp.plasmaPaddingSteps = 2;
    EXPECT_THROW(sp.validate(), QswException);
}

TEST_F(SimulationParametersTest, RejectsEmptyLattice) {
    auto sp               = smallRun();
    sp.plasmaPaddingSteps = 9;
    EXPECT_THROW(sp.validate(), QswException);
}

TEST_F(SimulationParametersTest, RejectsBadCoarsenessOrFineness) {
    auto sp           = smallRun();
    sp.plasmaFineness = 0;
    EXPECT_THROW(sp.validate(), QswException);

    sp                  = smallRun();
    sp.plasmaCoarseness = 0;
    EXPECT_THROW(sp.validate(), QswException);
}

TEST_F(SimulationParametersTest, RejectsNegativeSubtractionTrick) {
    auto sp             = smallRun();
    sp.subtractionTrick = -1;
    EXPECT_THROW(sp.validate(), QswException);
}

TEST_F(SimulationParametersTest, RejectsBadResidualTolerance) {
    auto sp              = smallRun();
    sp.checkResidual     = true;
    sp.residualTolerance = 0;
    EXPECT_THROW(sp.validate(), QswException);

    sp.checkResidual = false;
    EXPECT_NO_THROW(sp.validate());
}

TEST_F(SimulationParametersTest, RejectsWrongType) {
    qsw::ParameterList p;
    p.add("grid_steps", 21.0);
    EXPECT_THROW(qsw::SimulationParameters::fromParameterList(p), QswException);
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
