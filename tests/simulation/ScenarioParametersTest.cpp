#include "gtest/gtest.h"
#include "simulation/ScenarioParameters.hpp"
#include "exceptions/Exceptions.hpp"
#include <limits>
#include <string>

using namespace cyberrisk;

class ScenarioParametersTest : public ::testing::Test {
protected:
    ScenarioParameters params;

    void SetUp() override {
        params.assetValueMin = 50000.0;
        params.assetValueMode = 150000.0;
        params.assetValueMax = 500000.0;
        params.occurrenceCounts = {0, 1, 2, 3, 4, 5};
        params.occurrenceProbabilities = {0.3, 0.4, 0.2, 0.06, 0.03, 0.01};
        params.lossMu = 9.2;
        params.lossSigma = 1.0;
        params.paretoScale = 5000.0;
        params.paretoShape = 2.5;
        params.assetValueThreshold = 100000.0;
        params.lossExceedanceThreshold = 20000.0;
        params.lossRangeLower = 10000.0;
        params.lossRangeUpper = 30000.0;
        params.iterations = 1000;
        params.seed = 42;
    }

    std::string messageOf() const {
        try {
            params.validate();
        } catch (const InvalidParameterException& e) {
            return e.what();
        }
        return "";
    }
};

TEST_F(ScenarioParametersTest, WorkedExampleIsValid) {
    EXPECT_NO_THROW(params.validate());
}

TEST_F(ScenarioParametersTest, ProbabilitySumIsReportedInTheError) {
    params.occurrenceProbabilities = {0.3, 0.4, 0.2, 0.06, 0.01, 0.0};
    const std::string message = messageOf();
    EXPECT_NE(message.find("occurrence probabilities sum to 0.97"), std::string::npos) << message;
}

TEST_F(ScenarioParametersTest, AssetValueBoundsMustBeOrdered) {
    params.assetValueMode = 600000.0;
    EXPECT_THROW(params.validate(), InvalidParameterException);
    params.assetValueMode = 10000.0;
    EXPECT_THROW(params.validate(), InvalidParameterException);
}

TEST_F(ScenarioParametersTest, OccurrenceTableMustBeWellFormed) {
    params.occurrenceCounts = {0, 1};
    EXPECT_THROW(params.validate(), InvalidParameterException);

    SetUp();
    params.occurrenceCounts = {};
    params.occurrenceProbabilities = {};
    EXPECT_THROW(params.validate(), InvalidParameterException);

    SetUp();
    params.occurrenceCounts = {0, -1, 2, 3, 4, 5};
    EXPECT_THROW(params.validate(), InvalidParameterException);
}

TEST_F(ScenarioParametersTest, LossParametersMustBePositive) {
    params.lossSigma = 0.0;
    EXPECT_THROW(params.validate(), InvalidParameterException);

    SetUp();
    params.paretoScale = 0.0;
    EXPECT_THROW(params.validate(), InvalidParameterException);

    SetUp();
    params.paretoShape = -2.5;
    EXPECT_THROW(params.validate(), InvalidParameterException);
}

TEST_F(ScenarioParametersTest, NonFiniteValuesAreRejected) {
    params.lossMu = std::numeric_limits<double>::quiet_NaN();
    EXPECT_THROW(params.validate(), InvalidParameterException);

    SetUp();
    params.assetValueThreshold = std::numeric_limits<double>::infinity();
    EXPECT_THROW(params.validate(), InvalidParameterException);
}

TEST_F(ScenarioParametersTest, LossRangeMustBeOrdered) {
    params.lossRangeLower = 40000.0;
    EXPECT_THROW(params.validate(), InvalidParameterException);

    params.lossRangeLower = params.lossRangeUpper;
    EXPECT_NO_THROW(params.validate());
}

TEST_F(ScenarioParametersTest, IterationCountIsBounded) {
    params.iterations = 0;
    EXPECT_THROW(params.validate(), InvalidParameterException);

    params.iterations = 10000001;
    EXPECT_THROW(params.validate(), InvalidParameterException);

    params.iterations = 1;
    EXPECT_NO_THROW(params.validate());
}
