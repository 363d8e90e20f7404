#include "distributions/LogNormalDistribution.hpp"
#include "exceptions/Exceptions.hpp"
#include <gsl/gsl_randist.h>
#include <gsl/gsl_cdf.h>
#include <cmath>
#include <sstream>

namespace cyberrisk {

LogNormalDistribution::LogNormalDistribution(double mu, double sigma)
    : mu_(mu), sigma_(sigma)
{
    if (!std::isfinite(mu) || !std::isfinite(sigma)) {
        THROW_INVALID_PARAM("LogNormalDistribution", "mu and sigma must be finite.");
    }
    if (sigma <= 0.0) {
        std::ostringstream oss;
        oss << "sigma is " << sigma << ", expected sigma > 0";
        THROW_INVALID_PARAM("LogNormalDistribution", oss.str());
    }
}

std::vector<double> LogNormalDistribution::sample(RandomGenerator& rng, std::size_t n) const {
    std::vector<double> draws(n);
    for (std::size_t i = 0; i < n; ++i) {
        draws[i] = gsl_ran_lognormal(rng.get(), mu_, sigma_);
    }
    return draws;
}

double LogNormalDistribution::cdf(double x) const {
    if (x <= 0.0) return 0.0;
    return gsl_cdf_lognormal_P(x, mu_, sigma_);
}

double LogNormalDistribution::mean() const {
    return std::exp(mu_ + 0.5 * sigma_ * sigma_);
}

double LogNormalDistribution::variance() const {
    const double s2 = sigma_ * sigma_;
    return (std::exp(s2) - 1.0) * std::exp(2.0 * mu_ + s2);
}

std::string LogNormalDistribution::describe() const {
    std::ostringstream oss;
    oss << "LogNormal(mu=" << mu_ << ", sigma=" << sigma_ << ")";
    return oss.str();
}

} // namespace cyberrisk
