#include "gtest/gtest.h"
#include "distributions/TriangularDistribution.hpp"
#include "distributions/RandomGenerator.hpp"
#include "distributions/SampleStatistics.hpp"
#include "exceptions/Exceptions.hpp"
#include <cmath>
#include <limits>
#include <vector>

using namespace cyberrisk;

class TriangularDistributionTest : public ::testing::Test {
protected:
    const double a = 50000.0;
    const double c = 150000.0;
    const double b = 500000.0;
};

TEST_F(TriangularDistributionTest, RejectsModeOutsideBounds) {
    EXPECT_THROW(TriangularDistribution(a, a - 1.0, b), InvalidParameterException);
    EXPECT_THROW(TriangularDistribution(a, b + 1.0, b), InvalidParameterException);
    EXPECT_THROW(TriangularDistribution(b, c, a), InvalidParameterException);
    EXPECT_THROW(TriangularDistribution(a, std::numeric_limits<double>::quiet_NaN(), b), InvalidParameterException);
}

TEST_F(TriangularDistributionTest, ErrorMessageNamesTheBounds) {
    try {
        TriangularDistribution(10.0, 20.0, 15.0);
        FAIL() << "Expected InvalidParameterException";
    } catch (const InvalidParameterException& e) {
        EXPECT_NE(std::string(e.what()).find("min <= mode <= max"), std::string::npos);
    }
}

TEST_F(TriangularDistributionTest, CdfIsPiecewiseQuadraticAndMonotonic) {
    TriangularDistribution dist(a, c, b);
    EXPECT_DOUBLE_EQ(dist.cdf(a), 0.0);
    EXPECT_DOUBLE_EQ(dist.cdf(a - 1000.0), 0.0);
    EXPECT_DOUBLE_EQ(dist.cdf(b), 1.0);
    EXPECT_DOUBLE_EQ(dist.cdf(b + 1000.0), 1.0);
    EXPECT_NEAR(dist.cdf(c), (c - a) / (b - a), 1e-12);
    EXPECT_NEAR(dist.cdf(100000.0), 2.5e9 / 4.5e10, 1e-12);

    double previous = 0.0;
    for (double x = a; x <= b; x += 5000.0) {
        const double current = dist.cdf(x);
        EXPECT_GE(current, previous);
        previous = current;
    }
}

TEST_F(TriangularDistributionTest, QuantileInvertsCdf) {
    TriangularDistribution dist(a, c, b);
    for (double u : {0.0, 0.05, 0.2, 0.5, 0.75, 0.99, 1.0}) {
        EXPECT_NEAR(dist.cdf(dist.quantile(u)), u, 1e-9);
    }
}

TEST_F(TriangularDistributionTest, ClosedFormMoments) {
    TriangularDistribution dist(a, c, b);
    EXPECT_NEAR(dist.mean(), 700000.0 / 3.0, 1e-6);
    const double expectedVariance = (a * a + b * b + c * c - a * b - a * c - b * c) / 18.0;
    EXPECT_NEAR(dist.variance(), expectedVariance, 1e-3);
    EXPECT_NEAR(dist.median(), 500000.0 - std::sqrt(0.5 * 450000.0 * 350000.0), 1e-6);
    EXPECT_NEAR(dist.cdf(dist.median()), 0.5, 1e-12);
}

TEST_F(TriangularDistributionTest, SymmetricMedianIsMode) {
    TriangularDistribution dist(0.0, 5.0, 10.0);
    EXPECT_DOUBLE_EQ(dist.median(), 5.0);
}

TEST_F(TriangularDistributionTest, DegenerateDistributionAlwaysReturnsMin) {
    TriangularDistribution dist(7.0, 7.0, 7.0);
    RandomGenerator rng(1);
    for (double v : dist.sample(rng, 100)) {
        EXPECT_DOUBLE_EQ(v, 7.0);
    }
    EXPECT_DOUBLE_EQ(dist.median(), 7.0);
    EXPECT_DOUBLE_EQ(dist.cdf(7.0), 1.0);
}

TEST_F(TriangularDistributionTest, SamplesStayWithinBoundsAndMatchMean) {
    TriangularDistribution dist(a, c, b);
    RandomGenerator rng(7);
    const std::vector<double> draws = dist.sample(rng, 100000);
    ASSERT_EQ(draws.size(), 100000u);
    for (double v : draws) {
        ASSERT_GE(v, a);
        ASSERT_LE(v, b);
    }
    EXPECT_NEAR(SampleStatistics::mean(draws), dist.mean(), 0.01 * dist.mean());
}

TEST_F(TriangularDistributionTest, SameSeedGivesSameDraws) {
    TriangularDistribution dist(a, c, b);
    RandomGenerator first(123);
    RandomGenerator second(123);
    EXPECT_EQ(dist.sample(first, 1000), dist.sample(second, 1000));
}
