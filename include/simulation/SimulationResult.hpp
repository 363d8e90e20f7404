#ifndef LOSS_SIMULATION_RESULT_HPP
#define LOSS_SIMULATION_RESULT_HPP

#include "distributions/SampleStatistics.hpp"
#include <cstddef>
#include <optional>

namespace cyberrisk {

    /**
     * @brief Aggregate metrics of one loss-expectancy simulation run.
     *
     * Produced once by LossExpectancySimulator::run and returned by value.
     */
    struct SimulationResult {
        /** @brief Annualized loss expectancy, the mean per-iteration annual loss. */
        double annualLossExpectancy = 0.0;

        double assetValueMean = 0.0;
        double assetValueMedian = 0.0;

        /** @brief Moments of the combined (log-normal + Pareto) loss factor sample. */
        double combinedLossMean = 0.0;
        double combinedLossVariance = 0.0;

        /** @brief Empirical P(asset value <= asset threshold). */
        double probAssetValueAtMost = 0.0;
        /** @brief Empirical P(combined loss >= exceedance threshold). */
        double probLossAtLeast = 0.0;
        /** @brief Empirical P(lower <= combined loss <= upper). */
        double probLossWithin = 0.0;

        std::optional<PercentileBreakdown> assetValuePercentiles;
        std::optional<PercentileBreakdown> annualLossPercentiles;

        // Closed-form counterparts of the empirical estimates
        double expectedOccurrences = 0.0;
        double occurrenceVariance = 0.0;
        double analyticAssetValueMean = 0.0;
        double analyticAssetValueMedian = 0.0;
        double analyticProbAssetValueAtMost = 0.0;

        std::size_t iterations = 0;
        unsigned long seed = 0;
    };

} // namespace cyberrisk

#endif // LOSS_SIMULATION_RESULT_HPP
