#ifndef LOG_NORMAL_DISTRIBUTION_HPP
#define LOG_NORMAL_DISTRIBUTION_HPP

#include "distributions/interfaces/IDistribution.hpp"

namespace cyberrisk {

/**
 * @brief LogNormal(mu, sigma): exp of a Normal(mu, sigma) draw.
 */
class LogNormalDistribution : public IDistribution {
public:
    /**
     * @throws InvalidParameterException if sigma <= 0 or either parameter is not finite.
     */
    LogNormalDistribution(double mu, double sigma);

    std::vector<double> sample(RandomGenerator& rng, std::size_t n) const override;
    double cdf(double x) const override;
    double mean() const override;
    double variance() const override;
    std::string describe() const override;

    double getMu() const { return mu_; }
    double getSigma() const { return sigma_; }

private:
    double mu_;
    double sigma_;
};

} // namespace cyberrisk

#endif // LOG_NORMAL_DISTRIBUTION_HPP
