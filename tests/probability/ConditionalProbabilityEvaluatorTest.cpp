#include "gtest/gtest.h"
#include "probability/ConditionalProbabilityEvaluator.hpp"
#include "probability/CellDetectionModel.hpp"
#include "probability/MarginalDetectionModel.hpp"
#include "exceptions/Exceptions.hpp"
#include <Eigen/Dense>
#include <limits>
#include <memory>
#include <vector>

using namespace cyberrisk;

class ConditionalProbabilityEvaluatorTest : public ::testing::Test {
protected:
    std::unique_ptr<JointObservationTable> table;
    std::unique_ptr<ConditionalProbabilityEvaluator> evaluator;

    // P(T | X = 2..5) followed by P(T | Y = 6, 7)
    const std::vector<double> consistentRates = {0.8, 0.75, 0.7, 0.65, 0.75, 0.7};
    const std::vector<double> inconsistentRates = {0.8, 0.75, 0.7, 0.65, 0.6, 0.55};

    void SetUp() override {
        Eigen::MatrixXi counts(3, 4);
        counts << 25, 35, 20, 15,
                  30, 40, 25, 10,
                  15, 25, 30, 20;
        table = std::make_unique<JointObservationTable>(counts, 290);
        evaluator = std::make_unique<ConditionalProbabilityEvaluator>(*table);
    }
};

TEST_F(ConditionalProbabilityEvaluatorTest, MarginalProbabilities) {
    EXPECT_NEAR(evaluator->marginalProbabilityY(8.0), 90.0 / 290.0, 1e-12);
    EXPECT_NEAR(evaluator->marginalProbabilityX(3.0), 100.0 / 290.0, 1e-12);

    double totalY = 0.0;
    for (double y : {6.0, 7.0, 8.0}) {
        totalY += evaluator->marginalProbabilityY(y);
    }
    EXPECT_NEAR(totalY, 1.0, 1e-12);
}

TEST_F(ConditionalProbabilityEvaluatorTest, RangeProbabilities) {
    EXPECT_NEAR(evaluator->probabilityXWithin(3.0, 4.0), 175.0 / 290.0, 1e-12);
    EXPECT_NEAR(evaluator->probabilityOfSumWithin(-std::numeric_limits<double>::infinity(), 10.0),
                165.0 / 290.0, 1e-12);
    EXPECT_NEAR(evaluator->probabilityOfSumWithin(13.0, 13.0), 20.0 / 290.0, 1e-12);
    EXPECT_DOUBLE_EQ(evaluator->probabilityOfSumWithin(20.0, 30.0), 0.0);
}

TEST_F(ConditionalProbabilityEvaluatorTest, UnknownLevelIsRejected) {
    EXPECT_THROW(evaluator->marginalProbabilityY(9.0), InvalidParameterException);
    EXPECT_THROW(evaluator->marginalProbabilityX(6.0), InvalidParameterException);
}

TEST_F(ConditionalProbabilityEvaluatorTest, ConsistentMarginalRatesGivePosterior) {
    const MarginalDetectionModel model = MarginalDetectionModel::fromRateList(consistentRates, *table);
    EXPECT_NEAR(evaluator->probabilityOfDetection(model), 212.75 / 290.0, 1e-12);
    EXPECT_NEAR(model.derivedLastYLikelihood(*table), 68.0 / 90.0, 1e-12);
    EXPECT_NEAR(evaluator->posteriorY(8.0, model), 68.0 / 212.75, 1e-12);
}

TEST_F(ConditionalProbabilityEvaluatorTest, PosteriorsOverAllLevelsSumToOne) {
    const MarginalDetectionModel model = MarginalDetectionModel::fromRateList(consistentRates, *table);
    double total = 0.0;
    for (double y : {6.0, 7.0, 8.0}) {
        const double posterior = evaluator->posteriorY(y, model);
        EXPECT_GE(posterior, 0.0);
        EXPECT_LE(posterior, 1.0);
        total += posterior;
    }
    EXPECT_NEAR(total, 1.0, 1e-12);
}

TEST_F(ConditionalProbabilityEvaluatorTest, InconsistentRatesAreRejected) {
    // These rates imply P(T | Y = 8) = 98 / 90
    const MarginalDetectionModel model = MarginalDetectionModel::fromRateList(inconsistentRates, *table);
    try {
        evaluator->posteriorY(8.0, model);
        FAIL() << "Expected InvalidParameterException";
    } catch (const InvalidParameterException& e) {
        EXPECT_NE(std::string(e.what()).find("inconsistent"), std::string::npos) << e.what();
    }
}

TEST_F(ConditionalProbabilityEvaluatorTest, ZeroDetectionMassHasNoPosterior) {
    const MarginalDetectionModel model =
        MarginalDetectionModel::fromRateList(std::vector<double>(6, 0.0), *table);
    EXPECT_DOUBLE_EQ(evaluator->probabilityOfDetection(model), 0.0);
    EXPECT_THROW(evaluator->posteriorY(8.0, model), DivisionByZeroException);
}

TEST_F(ConditionalProbabilityEvaluatorTest, RateListLengthMustMatchTable) {
    EXPECT_THROW(MarginalDetectionModel::fromRateList({0.8, 0.75, 0.7}, *table), InvalidParameterException);
}

TEST_F(ConditionalProbabilityEvaluatorTest, RatesOutsideUnitIntervalAreRejected) {
    Eigen::VectorXd xRates(4);
    xRates << 0.8, 1.2, 0.7, 0.65;
    Eigen::VectorXd yRates(2);
    yRates << 0.75, 0.7;
    EXPECT_THROW(MarginalDetectionModel(xRates, yRates), InvalidParameterException);
}

TEST_F(ConditionalProbabilityEvaluatorTest, UniformCellLikelihoodLeavesPriorUnchanged) {
    const CellDetectionModel model(Eigen::MatrixXd::Constant(3, 4, 0.5));
    EXPECT_NEAR(evaluator->probabilityOfDetection(model), 0.5, 1e-12);
    EXPECT_NEAR(evaluator->posteriorY(8.0, model), 90.0 / 290.0, 1e-12);
}

TEST_F(ConditionalProbabilityEvaluatorTest, CellLikelihoodConcentratedOnOneLevel) {
    Eigen::MatrixXd likelihoods = Eigen::MatrixXd::Zero(3, 4);
    likelihoods.row(2).setOnes();
    const CellDetectionModel model(likelihoods);
    EXPECT_NEAR(evaluator->posteriorY(8.0, model), 1.0, 1e-12);
    EXPECT_NEAR(evaluator->posteriorY(6.0, model), 0.0, 1e-12);
}

TEST_F(ConditionalProbabilityEvaluatorTest, CellLikelihoodsAreValidated) {
    EXPECT_THROW(CellDetectionModel(Eigen::MatrixXd::Constant(3, 4, 1.5)), InvalidParameterException);

    const CellDetectionModel wrongShape(Eigen::MatrixXd::Constant(2, 4, 0.5));
    EXPECT_THROW(evaluator->probabilityOfDetection(wrongShape), InvalidParameterException);

    const CellDetectionModel silent(Eigen::MatrixXd::Zero(3, 4));
    EXPECT_THROW(evaluator->posteriorY(8.0, silent), DivisionByZeroException);
}

TEST_F(ConditionalProbabilityEvaluatorTest, EvaluateFillsEveryField) {
    const MarginalDetectionModel model = MarginalDetectionModel::fromRateList(consistentRates, *table);
    const ConditionalProbabilityResult result = evaluator->evaluate(ConditionalQuery(), model);
    EXPECT_NEAR(result.pMarginal, 90.0 / 290.0, 1e-12);
    EXPECT_NEAR(result.pRange, 165.0 / 290.0, 1e-12);
    EXPECT_NEAR(result.pXRange, 175.0 / 290.0, 1e-12);
    EXPECT_NEAR(result.pDetection, 212.75 / 290.0, 1e-12);
    EXPECT_NEAR(result.pConditional, 68.0 / 212.75, 1e-12);
}

TEST_F(ConditionalProbabilityEvaluatorTest, ElementaryIdentities) {
    EXPECT_NEAR(ConditionalProbabilityEvaluator::conditionalProbability(0.2, 0.5), 0.4, 1e-12);
    EXPECT_NEAR(ConditionalProbabilityEvaluator::bayesPosterior(0.3, 0.8, 0.6), 0.4, 1e-12);
    EXPECT_THROW(ConditionalProbabilityEvaluator::conditionalProbability(0.2, 0.0), DivisionByZeroException);
    EXPECT_THROW(ConditionalProbabilityEvaluator::bayesPosterior(0.3, 0.8, 0.0), DivisionByZeroException);
}
