#ifndef SCENARIO_PARAMETERS_HPP
#define SCENARIO_PARAMETERS_HPP

#include <cstddef>
#include <optional>
#include <vector>

namespace cyberrisk {

/**
 * @brief Inputs of one loss-expectancy simulation run.
 *
 * Asset value is Triangular(min, mode, max), annual occurrences follow a discrete
 * distribution, and the per-incident loss factor is the sum of a LogNormal(mu, sigma)
 * and a Pareto(scale, shape) draw.
 */
struct ScenarioParameters {
    double assetValueMin = 0.0;
    double assetValueMode = 0.0;
    double assetValueMax = 0.0;

    std::vector<double> occurrenceCounts;
    std::vector<double> occurrenceProbabilities;

    double lossMu = 0.0;
    double lossSigma = 1.0;

    double paretoScale = 1.0;
    double paretoShape = 1.0;

    /** @brief Threshold for P(asset value <= t). */
    double assetValueThreshold = 0.0;
    /** @brief Threshold for P(combined loss >= t). */
    double lossExceedanceThreshold = 0.0;
    /** @brief Inclusive range for P(lower <= combined loss <= upper). */
    double lossRangeLower = 0.0;
    double lossRangeUpper = 0.0;

    std::size_t iterations = 10000;
    /** @brief Fixed seed for reproducible runs; a random seed is drawn when empty. */
    std::optional<unsigned long> seed;
    /** @brief Produce the P50..P99 breakdowns. */
    bool computePercentiles = true;

    /**
     * @brief Check every invariant of the scenario.
     *
     * Runs before any sampling. The exception message names the failed invariant
     * and the offending values.
     *
     * @throws InvalidParameterException on the first violated invariant.
     */
    void validate() const;
};

} // namespace cyberrisk

#endif // SCENARIO_PARAMETERS_HPP
