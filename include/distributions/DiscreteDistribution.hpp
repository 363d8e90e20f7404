#ifndef DISCRETE_DISTRIBUTION_HPP
#define DISCRETE_DISTRIBUTION_HPP

#include "distributions/interfaces/IDistribution.hpp"
#include <vector>

namespace cyberrisk {

/**
 * @brief Discrete custom distribution over an ordered set of values.
 *
 * Sampling inverts the cumulative sum of the probabilities: a uniform u selects the
 * first value whose cumulative probability exceeds u. Used for annual occurrence
 * counts.
 */
class DiscreteDistribution : public IDistribution {
public:
    /**
     * @param values Support points, in the order used for the cumulative sum.
     * @param probabilities Matching probabilities; non-negative, summing to 1 within
     *        constants::PROBABILITY_SUM_TOLERANCE.
     * @throws InvalidParameterException on empty input, length mismatch, negative or
     *         non-finite entries, or a probability sum outside tolerance.
     */
    DiscreteDistribution(std::vector<double> values, std::vector<double> probabilities);

    std::vector<double> sample(RandomGenerator& rng, std::size_t n) const override;

    /** @brief Step CDF: sum of probabilities of values <= x. */
    double cdf(double x) const override;

    double mean() const override;
    double variance() const override;
    std::string describe() const override;

    const std::vector<double>& getValues() const { return values_; }
    const std::vector<double>& getProbabilities() const { return probabilities_; }

private:
    std::vector<double> values_;
    std::vector<double> probabilities_;
    std::vector<double> cumulative_;
};

} // namespace cyberrisk

#endif // DISCRETE_DISTRIBUTION_HPP
