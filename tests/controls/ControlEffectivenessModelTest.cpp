#include "gtest/gtest.h"
#include "controls/ControlEffectivenessModel.hpp"
#include "exceptions/Exceptions.hpp"
#include <Eigen/Dense>

using namespace cyberrisk;

class ControlEffectivenessModelTest : public ::testing::Test {
protected:
    ControlDeploymentMatrix history;
    Eigen::VectorXd current;

    void SetUp() override {
        history.counts.resize(4, 9);
        history.counts << 2, 3, 1, 4, 2, 3, 1, 2, 3,
                          1, 2, 3, 2, 1, 2, 3, 1, 2,
                          3, 2, 4, 1, 3, 2, 4, 3, 2,
                          1, 1, 2, 2, 1, 1, 2, 1, 1;
        history.safeguardEffects.resize(9);
        history.safeguardEffects << 85, 78, 92, 70, 88, 82, 95, 87, 80;
        history.maintenanceLoads.resize(9);
        history.maintenanceLoads << 45, 52, 38, 65, 42, 48, 35, 44, 50;

        current.resize(4);
        current << 2, 1, 3, 1;
    }
};

TEST_F(ControlEffectivenessModelTest, NoInterceptFitMatchesNormalEquations) {
    const ControlEffectivenessFit fit = ControlEffectivenessModel().fit(history);
    ASSERT_EQ(fit.effectCoefficients.size(), 4);
    EXPECT_FALSE(fit.hasIntercept);
    EXPECT_EQ(fit.observations, 9);

    EXPECT_NEAR(fit.effectCoefficients(0), 13.125, 1e-8);
    EXPECT_NEAR(fit.effectCoefficients(1), 0.875, 1e-8);
    EXPECT_NEAR(fit.effectCoefficients(2), 62.0 / 3.0, 1e-8);
    EXPECT_NEAR(fit.effectCoefficients(3), -59.0 / 24.0, 1e-8);

    EXPECT_NEAR(fit.loadCoefficients(0), 13.175, 1e-8);
    EXPECT_NEAR(fit.loadCoefficients(1), -2.375, 1e-8);
    EXPECT_NEAR(fit.loadCoefficients(2), 67.0 / 15.0, 1e-8);
    EXPECT_NEAR(fit.loadCoefficients(3), 151.0 / 24.0, 1e-8);

    EXPECT_DOUBLE_EQ(fit.effectIntercept, 0.0);
    EXPECT_DOUBLE_EQ(fit.loadIntercept, 0.0);
}

TEST_F(ControlEffectivenessModelTest, PredictsCurrentDeployment) {
    const ControlEffectivenessFit fit = ControlEffectivenessModel().fit(history);
    EXPECT_NEAR(fit.predictEffect(current), 260.0 / 3.0, 1e-8);
    EXPECT_NEAR(fit.predictLoad(current), 131.0 / 3.0, 1e-8);
    EXPECT_THROW(fit.predictEffect(Eigen::Vector2d(1.0, 2.0)), InvalidParameterException);
}

TEST_F(ControlEffectivenessModelTest, GoodnessOfFitIsBounded) {
    const ControlEffectivenessFit fit = ControlEffectivenessModel().fit(history);
    EXPECT_LE(fit.effectRSquared, 1.0);
    EXPECT_LE(fit.loadRSquared, 1.0);
}

TEST_F(ControlEffectivenessModelTest, CollinearHistoryWithInterceptIsSingular) {
    // Controls 1 and 3 always sum to 5, which duplicates the intercept column
    try {
        ControlEffectivenessModel(true).fit(history);
        FAIL() << "Expected InvalidParameterException";
    } catch (const InvalidParameterException& e) {
        EXPECT_NE(std::string(e.what()).find("singular"), std::string::npos) << e.what();
    }
}

TEST_F(ControlEffectivenessModelTest, InterceptModelRecoversExactRelationship) {
    ControlDeploymentMatrix exact;
    exact.counts.resize(2, 5);
    exact.counts << 1, 2, 3, 1, 2,
                    2, 1, 3, 3, 1;
    // effect = 2 + 3a - b, load = 1 + a + b
    exact.safeguardEffects.resize(5);
    exact.safeguardEffects << 3, 7, 8, 2, 7;
    exact.maintenanceLoads.resize(5);
    exact.maintenanceLoads << 4, 4, 7, 5, 4;

    const ControlEffectivenessFit fit = ControlEffectivenessModel(true).fit(exact);
    EXPECT_TRUE(fit.hasIntercept);
    EXPECT_NEAR(fit.effectIntercept, 2.0, 1e-9);
    EXPECT_NEAR(fit.effectCoefficients(0), 3.0, 1e-9);
    EXPECT_NEAR(fit.effectCoefficients(1), -1.0, 1e-9);
    EXPECT_NEAR(fit.loadIntercept, 1.0, 1e-9);
    EXPECT_NEAR(fit.effectRSquared, 1.0, 1e-9);
    EXPECT_NEAR(fit.loadRSquared, 1.0, 1e-9);
    EXPECT_NEAR(fit.predictEffect(Eigen::Vector2d(4.0, 0.0)), 14.0, 1e-9);
}

TEST_F(ControlEffectivenessModelTest, TooFewPeriodsAreRejected) {
    history.counts = history.counts.leftCols(4).eval();
    history.safeguardEffects = history.safeguardEffects.head(4).eval();
    history.maintenanceLoads = history.maintenanceLoads.head(4).eval();
    EXPECT_THROW(ControlEffectivenessModel().fit(history), InvalidParameterException);
}

TEST_F(ControlEffectivenessModelTest, MismatchedHistoryIsRejected) {
    history.safeguardEffects = history.safeguardEffects.head(8).eval();
    EXPECT_THROW(ControlEffectivenessModel().fit(history), InvalidParameterException);

    SetUp();
    history.counts(0, 0) = -1.0;
    EXPECT_THROW(ControlEffectivenessModel().fit(history), InvalidParameterException);

    SetUp();
    history.controlNames = {"Firewall"};
    EXPECT_THROW(ControlEffectivenessModel().fit(history), InvalidParameterException);
}

TEST_F(ControlEffectivenessModelTest, ControlNamesDefaultToTypeIndex) {
    EXPECT_EQ(history.nameOf(0), "Control Type 1");
    history.controlNames = {"Firewall", "IDS", "EDR", "Training"};
    EXPECT_EQ(history.nameOf(2), "EDR");
}
