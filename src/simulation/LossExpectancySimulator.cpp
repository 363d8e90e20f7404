#include "simulation/LossExpectancySimulator.hpp"
#include "distributions/RandomGenerator.hpp"
#include "distributions/SampleStatistics.hpp"
#include "utils/Logger.hpp"
#include <algorithm>
#include <sstream>
#include <utility>

namespace cyberrisk {

namespace {

    // Validation must run before any distribution is built, so it is chained
    // through the first member initializer.
    ScenarioParameters validated(ScenarioParameters parameters) {
        parameters.validate();
        return parameters;
    }

    void checkpoint(const CancellationToken* cancellation, const std::string& phase) {
        if (cancellation) {
            cancellation->throwIfCancelled("LossExpectancySimulator::run", phase);
        }
    }

} // namespace

LossExpectancySimulator::LossExpectancySimulator(ScenarioParameters parameters)
    : parameters_(validated(std::move(parameters))),
      assetValue_(parameters_.assetValueMin, parameters_.assetValueMode, parameters_.assetValueMax),
      occurrences_(parameters_.occurrenceCounts, parameters_.occurrenceProbabilities),
      lossA_(parameters_.lossMu, parameters_.lossSigma),
      lossB_(parameters_.paretoScale, parameters_.paretoShape)
{
    Logger::getInstance().debug("LossExpectancySimulator",
        "Scenario: " + assetValue_.describe() + ", " + occurrences_.describe() + ", " +
        lossA_.describe() + ", " + lossB_.describe());
}

SimulationResult LossExpectancySimulator::run(const CancellationToken* cancellation) const {
    const std::string F_NAME = "LossExpectancySimulator::run";
    auto& logger = Logger::getInstance();
    const std::size_t n = parameters_.iterations;

    checkpoint(cancellation, "sampling");
    RandomGenerator rng(parameters_.seed);
    logger.info(F_NAME, "Starting " + std::to_string(n) + " iterations with seed " +
                std::to_string(rng.getSeed()) + ".");

    // Draw order is fixed: seed reproducibility depends on it.
    std::vector<double> assetValues = assetValue_.sample(rng, n);
    logger.debug(F_NAME, "Asset values drawn.");
    checkpoint(cancellation, "occurrence sampling");

    const std::vector<double> counts = occurrences_.sample(rng, n);
    logger.debug(F_NAME, "Occurrence counts drawn.");
    checkpoint(cancellation, "log-normal loss sampling");

    std::vector<double> combinedLoss = lossA_.sample(rng, n);
    logger.debug(F_NAME, "Log-normal losses drawn.");
    checkpoint(cancellation, "Pareto loss sampling");

    const std::vector<double> paretoLoss = lossB_.sample(rng, n);
    logger.debug(F_NAME, "Pareto losses drawn.");
    checkpoint(cancellation, "aggregation");

    std::vector<double> annualLoss(n);
    for (std::size_t i = 0; i < n; ++i) {
        combinedLoss[i] += paretoLoss[i];
        annualLoss[i] = assetValues[i] * combinedLoss[i] * counts[i];
    }

    SimulationResult result;
    result.iterations = n;
    result.seed = rng.getSeed();

    result.annualLossExpectancy = SampleStatistics::mean(annualLoss);
    result.assetValueMean = SampleStatistics::mean(assetValues);
    result.combinedLossMean = SampleStatistics::mean(combinedLoss);
    result.combinedLossVariance = SampleStatistics::variance(combinedLoss);

    result.probAssetValueAtMost = SampleStatistics::fractionAtMost(assetValues, parameters_.assetValueThreshold);
    result.probLossAtLeast = SampleStatistics::fractionAtLeast(combinedLoss, parameters_.lossExceedanceThreshold);
    result.probLossWithin = SampleStatistics::fractionWithin(combinedLoss, parameters_.lossRangeLower,
                                                             parameters_.lossRangeUpper);

    result.expectedOccurrences = occurrences_.mean();
    result.occurrenceVariance = occurrences_.variance();
    result.analyticAssetValueMean = assetValue_.mean();
    result.analyticAssetValueMedian = assetValue_.median();
    result.analyticProbAssetValueAtMost = assetValue_.cdf(parameters_.assetValueThreshold);
    logger.debug(F_NAME, "Moments and exceedance probabilities reduced.");
    checkpoint(cancellation, "percentile computation");

    std::sort(assetValues.begin(), assetValues.end());
    result.assetValueMedian = SampleStatistics::quantileFromSorted(assetValues, 0.5);
    if (parameters_.computePercentiles) {
        result.assetValuePercentiles = SampleStatistics::percentilesFromSorted(assetValues);
        std::sort(annualLoss.begin(), annualLoss.end());
        result.annualLossPercentiles = SampleStatistics::percentilesFromSorted(annualLoss);
    }

    std::ostringstream summary;
    summary << "ALE=" << result.annualLossExpectancy
            << ", asset value mean=" << result.assetValueMean
            << ", P(loss >= " << parameters_.lossExceedanceThreshold << ")=" << result.probLossAtLeast;
    logger.info(F_NAME, "Finished. " + summary.str());
    return result;
}

} // namespace cyberrisk
