#include "distributions/TriangularDistribution.hpp"
#include "exceptions/Exceptions.hpp"
#include <cmath>
#include <sstream>

namespace cyberrisk {

TriangularDistribution::TriangularDistribution(double min, double mode, double max)
    : min_(min), mode_(mode), max_(max)
{
    if (!std::isfinite(min) || !std::isfinite(mode) || !std::isfinite(max)) {
        THROW_INVALID_PARAM("TriangularDistribution", "min, mode and max must be finite.");
    }
    if (!(min <= mode && mode <= max)) {
        std::ostringstream oss;
        oss << "expected min <= mode <= max, got min=" << min << ", mode=" << mode << ", max=" << max;
        THROW_INVALID_PARAM("TriangularDistribution", oss.str());
    }
}

double TriangularDistribution::quantile(double u) const {
    const double range = max_ - min_;
    if (range <= 0.0) {
        return min_;
    }
    const double fMode = (mode_ - min_) / range;
    if (u < fMode) {
        return min_ + std::sqrt(u * range * (mode_ - min_));
    }
    return max_ - std::sqrt((1.0 - u) * range * (max_ - mode_));
}

std::vector<double> TriangularDistribution::sample(RandomGenerator& rng, std::size_t n) const {
    std::vector<double> draws(n);
    for (std::size_t i = 0; i < n; ++i) {
        draws[i] = quantile(rng.uniform());
    }
    return draws;
}

double TriangularDistribution::cdf(double x) const {
    if (x >= max_) return 1.0;
    if (x <= min_) return 0.0;
    const double range = max_ - min_;
    if (x <= mode_) {
        // min_ < x <= mode_, so the denominator is positive
        return ((x - min_) * (x - min_)) / (range * (mode_ - min_));
    }
    return 1.0 - ((max_ - x) * (max_ - x)) / (range * (max_ - mode_));
}

double TriangularDistribution::mean() const {
    return (min_ + mode_ + max_) / 3.0;
}

double TriangularDistribution::variance() const {
    return (min_ * min_ + mode_ * mode_ + max_ * max_
            - min_ * mode_ - min_ * max_ - mode_ * max_) / 18.0;
}

double TriangularDistribution::median() const {
    const double range = max_ - min_;
    if (range <= 0.0) {
        return min_;
    }
    const double fMode = (mode_ - min_) / range;
    if (std::abs(fMode - 0.5) < 1e-15) {
        return mode_;
    }
    if (fMode > 0.5) {
        return min_ + std::sqrt(0.5 * range * (mode_ - min_));
    }
    return max_ - std::sqrt(0.5 * range * (max_ - mode_));
}

std::string TriangularDistribution::describe() const {
    std::ostringstream oss;
    oss << "Triangular(min=" << min_ << ", mode=" << mode_ << ", max=" << max_ << ")";
    return oss.str();
}

} // namespace cyberrisk
