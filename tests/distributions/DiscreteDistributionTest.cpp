#include "gtest/gtest.h"
#include "distributions/DiscreteDistribution.hpp"
#include "distributions/RandomGenerator.hpp"
#include "exceptions/Exceptions.hpp"
#include <map>
#include <string>
#include <vector>

using namespace cyberrisk;

class DiscreteDistributionTest : public ::testing::Test {
protected:
    std::vector<double> counts = {0, 1, 2, 3, 4, 5};
    std::vector<double> probs = {0.3, 0.4, 0.2, 0.06, 0.03, 0.01};
};

TEST_F(DiscreteDistributionTest, RejectsLengthMismatch) {
    EXPECT_THROW(DiscreteDistribution(counts, {0.5, 0.5}), InvalidParameterException);
    EXPECT_THROW(DiscreteDistribution({}, {}), InvalidParameterException);
}

TEST_F(DiscreteDistributionTest, RejectsProbabilitiesNotSummingToOne) {
    try {
        DiscreteDistribution(counts, {0.3, 0.4, 0.2, 0.06, 0.01, 0.0});
        FAIL() << "Expected InvalidParameterException";
    } catch (const InvalidParameterException& e) {
        EXPECT_NE(std::string(e.what()).find("sum to 0.97"), std::string::npos) << e.what();
    }
}

TEST_F(DiscreteDistributionTest, AcceptsSumWithinTolerance) {
    EXPECT_NO_THROW(DiscreteDistribution({1, 2}, {0.5, 0.5 + 5e-7}));
}

TEST_F(DiscreteDistributionTest, RejectsNegativeProbability) {
    EXPECT_THROW(DiscreteDistribution({1, 2, 3}, {0.6, 0.6, -0.2}), InvalidParameterException);
}

TEST_F(DiscreteDistributionTest, ClosedFormMoments) {
    DiscreteDistribution dist(counts, probs);
    EXPECT_NEAR(dist.mean(), 1.15, 1e-12);
    EXPECT_NEAR(dist.variance(), 2.47 - 1.15 * 1.15, 1e-12);
}

TEST_F(DiscreteDistributionTest, CdfIsAStepFunction) {
    DiscreteDistribution dist(counts, probs);
    EXPECT_DOUBLE_EQ(dist.cdf(-1.0), 0.0);
    EXPECT_NEAR(dist.cdf(0.0), 0.3, 1e-12);
    EXPECT_NEAR(dist.cdf(0.5), 0.3, 1e-12);
    EXPECT_NEAR(dist.cdf(2.0), 0.9, 1e-12);
    EXPECT_NEAR(dist.cdf(5.0), 1.0, 1e-12);
}

TEST_F(DiscreteDistributionTest, EmpiricalFrequenciesConvergeToProbabilities) {
    DiscreteDistribution dist(counts, probs);
    RandomGenerator rng(2024);
    const std::size_t n = 200000;
    const std::vector<double> draws = dist.sample(rng, n);

    std::map<double, std::size_t> tally;
    for (double v : draws) {
        tally[v]++;
    }
    ASSERT_LE(tally.size(), counts.size());
    for (std::size_t i = 0; i < counts.size(); ++i) {
        const double frequency = static_cast<double>(tally[counts[i]]) / static_cast<double>(n);
        EXPECT_NEAR(frequency, probs[i], 0.005) << "value " << counts[i];
    }
}

TEST_F(DiscreteDistributionTest, ZeroProbabilityValuesAreNeverDrawn) {
    DiscreteDistribution dist({1, 2, 3}, {0.5, 0.0, 0.5});
    RandomGenerator rng(5);
    for (double v : dist.sample(rng, 10000)) {
        EXPECT_NE(v, 2.0);
    }
}
