#include "distributions/ParetoDistribution.hpp"
#include "exceptions/Exceptions.hpp"
#include <gsl/gsl_randist.h>
#include <gsl/gsl_cdf.h>
#include <cmath>
#include <limits>
#include <sstream>

namespace cyberrisk {

ParetoDistribution::ParetoDistribution(double scale, double shape)
    : scale_(scale), shape_(shape)
{
    if (!std::isfinite(scale) || !std::isfinite(shape) || scale <= 0.0 || shape <= 0.0) {
        std::ostringstream oss;
        oss << "scale is " << scale << " and shape is " << shape << ", expected both finite and > 0";
        THROW_INVALID_PARAM("ParetoDistribution", oss.str());
    }
}

std::vector<double> ParetoDistribution::sample(RandomGenerator& rng, std::size_t n) const {
    std::vector<double> draws(n);
    for (std::size_t i = 0; i < n; ++i) {
        // GSL argument order is (shape, scale)
        draws[i] = gsl_ran_pareto(rng.get(), shape_, scale_);
    }
    return draws;
}

double ParetoDistribution::cdf(double x) const {
    if (x <= scale_) return 0.0;
    return gsl_cdf_pareto_P(x, shape_, scale_);
}

double ParetoDistribution::mean() const {
    if (shape_ <= 1.0) return std::numeric_limits<double>::infinity();
    return shape_ * scale_ / (shape_ - 1.0);
}

double ParetoDistribution::variance() const {
    if (shape_ <= 2.0) return std::numeric_limits<double>::infinity();
    return scale_ * scale_ * shape_ / ((shape_ - 1.0) * (shape_ - 1.0) * (shape_ - 2.0));
}

std::string ParetoDistribution::describe() const {
    std::ostringstream oss;
    oss << "Pareto(scale=" << scale_ << ", shape=" << shape_ << ")";
    return oss.str();
}

} // namespace cyberrisk
