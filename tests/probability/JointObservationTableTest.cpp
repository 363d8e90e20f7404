#include "gtest/gtest.h"
#include "probability/JointObservationTable.hpp"
#include "exceptions/Exceptions.hpp"
#include <Eigen/Dense>

using namespace cyberrisk;

class JointObservationTableTest : public ::testing::Test {
protected:
    Eigen::MatrixXi counts;

    void SetUp() override {
        counts.resize(3, 4);
        counts << 25, 35, 20, 15,
                  30, 40, 25, 10,
                  15, 25, 30, 20;
    }
};

TEST_F(JointObservationTableTest, DefaultLevelsDescribeTheStandardLayout) {
    JointObservationTable table(counts, 290);
    ASSERT_EQ(table.getXLevels().size(), 4);
    ASSERT_EQ(table.getYLevels().size(), 3);
    EXPECT_DOUBLE_EQ(table.getXLevels()(0), 2.0);
    EXPECT_DOUBLE_EQ(table.getXLevels()(3), 5.0);
    EXPECT_DOUBLE_EQ(table.getYLevels()(0), 6.0);
    EXPECT_DOUBLE_EQ(table.getYLevels()(2), 8.0);
}

TEST_F(JointObservationTableTest, CountsMustSumToTotalTrials) {
    try {
        JointObservationTable(counts, 300);
        FAIL() << "Expected InvalidParameterException";
    } catch (const InvalidParameterException& e) {
        EXPECT_NE(std::string(e.what()).find("sum to 290"), std::string::npos) << e.what();
    }
}

TEST_F(JointObservationTableTest, NegativeCountsAreRejected) {
    counts(1, 1) = -40;
    EXPECT_THROW(JointObservationTable(counts, 210), InvalidParameterException);
}

TEST_F(JointObservationTableTest, EmptyTableIsRejected) {
    Eigen::MatrixXi zeros = Eigen::MatrixXi::Zero(3, 4);
    EXPECT_THROW(JointObservationTable(zeros, 0), InvalidParameterException);
}

TEST_F(JointObservationTableTest, DefaultLevelsRequireThreeByFour) {
    Eigen::MatrixXi square(2, 2);
    square << 1, 2, 3, 4;
    EXPECT_THROW(JointObservationTable(square, 10), InvalidParameterException);
}

TEST_F(JointObservationTableTest, ExplicitLevelsSupportOtherShapes) {
    Eigen::MatrixXi square(2, 2);
    square << 1, 2, 3, 4;
    Eigen::VectorXd xs(2);
    xs << 0.0, 1.0;
    Eigen::VectorXd ys(2);
    ys << 10.0, 20.0;
    JointObservationTable table(square, 10, xs, ys);
    EXPECT_EQ(table.rows(), 2);
    EXPECT_EQ(table.cols(), 2);
    EXPECT_EQ(table.rowOfY(20.0), 1);
    EXPECT_EQ(table.colOfX(0.0), 0);
    EXPECT_DOUBLE_EQ(table.jointProbability(1, 1), 0.4);
}

TEST_F(JointObservationTableTest, LevelsMustMatchShapeAndBeDistinct) {
    Eigen::VectorXd xs(3);
    xs << 2.0, 3.0, 4.0;
    EXPECT_THROW(JointObservationTable(counts, 290, xs, JointObservationTable::defaultYLevels()),
                 InvalidParameterException);

    Eigen::VectorXd duplicated(4);
    duplicated << 2.0, 3.0, 3.0, 5.0;
    EXPECT_THROW(JointObservationTable(counts, 290, duplicated, JointObservationTable::defaultYLevels()),
                 InvalidParameterException);
}

TEST_F(JointObservationTableTest, UnknownLevelIsRejected) {
    JointObservationTable table(counts, 290);
    EXPECT_THROW(table.rowOfY(9.0), InvalidParameterException);
    EXPECT_THROW(table.colOfX(1.0), InvalidParameterException);
    EXPECT_THROW(table.jointProbability(3, 0), InvalidParameterException);
}

TEST_F(JointObservationTableTest, SummaryReportsMarginals) {
    const JointTableSummary summary = JointObservationTable(counts, 290).summarize();
    EXPECT_EQ(summary.total, 290);

    Eigen::VectorXi expectedRows(3);
    expectedRows << 95, 105, 90;
    Eigen::VectorXi expectedCols(4);
    expectedCols << 70, 100, 75, 45;
    EXPECT_EQ(summary.rowMarginals, expectedRows);
    EXPECT_EQ(summary.colMarginals, expectedCols);

    EXPECT_NEAR(summary.rowProbabilities.sum(), 1.0, 1e-12);
    EXPECT_NEAR(summary.colProbabilities.sum(), 1.0, 1e-12);
    EXPECT_NEAR(summary.jointProbabilities.sum(), 1.0, 1e-12);
    EXPECT_NEAR(summary.jointProbabilities(2, 3), 20.0 / 290.0, 1e-12);
}
