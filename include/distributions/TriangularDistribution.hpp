#ifndef TRIANGULAR_DISTRIBUTION_HPP
#define TRIANGULAR_DISTRIBUTION_HPP

#include "distributions/interfaces/IDistribution.hpp"

namespace cyberrisk {

/**
 * @brief Triangular(min, mode, max) distribution, sampled by inverse CDF.
 *
 * Used for asset values. A degenerate distribution with min == max is accepted and
 * always yields min.
 */
class TriangularDistribution : public IDistribution {
public:
    /**
     * @throws InvalidParameterException unless min <= mode <= max and all are finite.
     */
    TriangularDistribution(double min, double mode, double max);

    std::vector<double> sample(RandomGenerator& rng, std::size_t n) const override;

    /**
     * @brief Piecewise quadratic CDF, continuous and monotonic on [min, max].
     */
    double cdf(double x) const override;

    double mean() const override;
    double variance() const override;
    std::string describe() const override;

    /** @brief Closed-form median. */
    double median() const;

    /** @brief Inverse CDF for u in [0, 1]. */
    double quantile(double u) const;

    double getMin() const { return min_; }
    double getMode() const { return mode_; }
    double getMax() const { return max_; }

private:
    double min_;
    double mode_;
    double max_;
};

} // namespace cyberrisk

#endif // TRIANGULAR_DISTRIBUTION_HPP
