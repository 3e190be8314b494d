//
// Unit test ParameterListTest
//   Test functionality of the class ParameterList.
//
#include "Qsw.h"

#include <sstream>

#include "Utility/ParameterList.h"

#include "Utility/QswException.h"

#include "gtest/gtest.h"

class ParameterListTest : public ::testing::Test {
public:
    ParameterListTest() {}
};

TEST_F(ParameterListTest, Add) {
    qsw::ParameterList p;
    p.add<double>("grid_step_size", 0.025);

    EXPECT_THROW(p.add<double>("grid_step_size", 0.05), QswException);
    ASSERT_DOUBLE_EQ(p.get<double>("grid_step_size"), 0.025);
}

TEST_F(ParameterListTest, GetMissingOrMistyped) {
    qsw::ParameterList p;
    p.add<int>("grid_steps", 641);

    EXPECT_THROW(p.get<int>("xi_steps"), QswException);
    EXPECT_THROW(p.get<double>("grid_steps"), QswException);
    ASSERT_EQ(p.get<int>("grid_steps"), 641);
}

TEST_F(ParameterListTest, GetWithDefault) {
    qsw::ParameterList p;
    p.add<bool>("check_residual", true);

    ASSERT_TRUE(p.get<bool>("check_residual", false));
    ASSERT_EQ(p.get<int>("plasma_fineness", 2), 2);
}

TEST_F(ParameterListTest, UpdateSingle) {
    double tol = 1.0e-6;

    qsw::ParameterList p;
    p.add<double>("residual_tolerance", 1.0e-9);

    p.update("residual_tolerance", tol);

    ASSERT_DOUBLE_EQ(p.get<double>("residual_tolerance"), tol);

    EXPECT_THROW(p.update<bool>("check_residual", true), QswException);
    ASSERT_FALSE(p.contains("check_residual"));
}

TEST_F(ParameterListTest, Merge) {
    qsw::ParameterList p1;
    p1.add<double>("xi_step_size", 0.005);
    p1.add<bool>("check_residual", false);

    qsw::ParameterList p2;

    double dxi = 0.01;
    int steps  = 11;

    p2.add<int>("grid_steps", steps);
    p2.add<double>("xi_step_size", dxi);

    p1.merge(p2);

    ASSERT_DOUBLE_EQ(p1.get<double>("xi_step_size"), dxi);
    ASSERT_EQ(p1.get<int>("grid_steps"), steps);
    ASSERT_FALSE(p1.get<bool>("check_residual"));
}

TEST_F(ParameterListTest, Update) {
    qsw::ParameterList p1;
    p1.add<double>("xi_step_size", 0.005);
    p1.add<bool>("check_residual", false);

    qsw::ParameterList p2;

    double dxi = 0.01;

    p2.add<int>("grid_steps", 11);
    p2.add<double>("xi_step_size", dxi);

    p1.update(p2);

    // update only modifies the values of existing parameters
    ASSERT_DOUBLE_EQ(p1.get<double>("xi_step_size"), dxi);
    ASSERT_FALSE(p1.contains("grid_steps"));
    ASSERT_FALSE(p1.get<bool>("check_residual"));
}

TEST_F(ParameterListTest, Print) {
    qsw::ParameterList p;
    p.add<int>("grid_steps", 641);
    p.add<double>("xi_step_size", 0.005);

    std::ostringstream os;
    os << p;

    const std::string out = os.str();
    EXPECT_NE(out.find("grid_steps"), std::string::npos);
    EXPECT_NE(out.find("641"), std::string::npos);
    EXPECT_NE(out.find("xi_step_size"), std::string::npos);
}

TEST_F(ParameterListTest, AssignFromText) {
    qsw::ParameterList p;
    p.add<int>("grid_steps", 641);
    p.add<double>("xi_step_size", 0.005);
    p.add<bool>("check_residual", false);

    p.assign("grid_steps=321");
    p.assign("xi_step_size=1e-2");
    p.assign("check_residual=on");

    ASSERT_EQ(p.get<int>("grid_steps"), 321);
    ASSERT_DOUBLE_EQ(p.get<double>("xi_step_size"), 0.01);
    ASSERT_TRUE(p.get<bool>("check_residual"));
}

TEST_F(ParameterListTest, AssignRejectsBadText) {
    qsw::ParameterList p;
    p.add<int>("grid_steps", 641);
    p.add<bool>("check_residual", false);

    EXPECT_THROW(p.assign("grid_steps"), QswException);
    EXPECT_THROW(p.assign("=3"), QswException);
    EXPECT_THROW(p.assign("xi_steps=10"), QswException);
    EXPECT_THROW(p.assign("grid_steps=64x"), QswException);
    EXPECT_THROW(p.assign("grid_steps="), QswException);
    EXPECT_THROW(p.assign("check_residual=maybe"), QswException);
    ASSERT_EQ(p.get<int>("grid_steps"), 641);
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
