#ifndef PARETO_DISTRIBUTION_HPP
#define PARETO_DISTRIBUTION_HPP

#include "distributions/interfaces/IDistribution.hpp"

namespace cyberrisk {

/**
 * @brief Pareto(scale, shape) with support [scale, inf).
 *
 * Draws are scale * u^(-1/shape) for u uniform on (0, 1), i.e. the inverse CDF.
 * The mean is infinite for shape <= 1 and the variance for shape <= 2.
 */
class ParetoDistribution : public IDistribution {
public:
    /**
     * @throws InvalidParameterException if scale <= 0 or shape <= 0.
     */
    ParetoDistribution(double scale, double shape);

    std::vector<double> sample(RandomGenerator& rng, std::size_t n) const override;
    double cdf(double x) const override;
    double mean() const override;
    double variance() const override;
    std::string describe() const override;

    double getScale() const { return scale_; }
    double getShape() const { return shape_; }

private:
    double scale_;
    double shape_;
};

} // namespace cyberrisk

#endif // PARETO_DISTRIBUTION_HPP
