#include "distributions/DiscreteDistribution.hpp"
#include "core/RiskConstants.hpp"
#include "exceptions/Exceptions.hpp"
#include <algorithm>
#include <cmath>
#include <numeric>
#include <sstream>
#include <utility>

namespace cyberrisk {

DiscreteDistribution::DiscreteDistribution(std::vector<double> values, std::vector<double> probabilities)
    : values_(std::move(values)), probabilities_(std::move(probabilities))
{
    const std::string F_NAME = "DiscreteDistribution";
    if (values_.empty()) {
        THROW_INVALID_PARAM(F_NAME, "at least one value is required.");
    }
    if (values_.size() != probabilities_.size()) {
        THROW_INVALID_PARAM(F_NAME, "got " + std::to_string(values_.size()) + " values but " +
                            std::to_string(probabilities_.size()) + " probabilities.");
    }
    for (std::size_t i = 0; i < values_.size(); ++i) {
        if (!std::isfinite(values_[i])) {
            THROW_INVALID_PARAM(F_NAME, "value at index " + std::to_string(i) + " is not finite.");
        }
        if (!std::isfinite(probabilities_[i]) || probabilities_[i] < 0.0) {
            std::ostringstream oss;
            oss << "probability at index " << i << " is " << probabilities_[i] << ", expected a finite value >= 0";
            THROW_INVALID_PARAM(F_NAME, oss.str());
        }
    }
    const double total = std::accumulate(probabilities_.begin(), probabilities_.end(), 0.0);
    if (std::abs(total - 1.0) > constants::PROBABILITY_SUM_TOLERANCE) {
        std::ostringstream oss;
        oss << "probabilities sum to " << total << ", expected 1.0 ± " << constants::PROBABILITY_SUM_TOLERANCE;
        THROW_INVALID_PARAM(F_NAME, oss.str());
    }

    cumulative_.resize(probabilities_.size());
    std::partial_sum(probabilities_.begin(), probabilities_.end(), cumulative_.begin());
}

std::vector<double> DiscreteDistribution::sample(RandomGenerator& rng, std::size_t n) const {
    std::vector<double> draws(n);
    for (std::size_t i = 0; i < n; ++i) {
        const double u = rng.uniform();
        auto it = std::upper_bound(cumulative_.begin(), cumulative_.end(), u);
        // u can sit above the last cumulative value when the sum is slightly below 1
        const std::size_t index = (it == cumulative_.end())
            ? cumulative_.size() - 1
            : static_cast<std::size_t>(std::distance(cumulative_.begin(), it));
        draws[i] = values_[index];
    }
    return draws;
}

double DiscreteDistribution::cdf(double x) const {
    double total = 0.0;
    for (std::size_t i = 0; i < values_.size(); ++i) {
        if (values_[i] <= x) total += probabilities_[i];
    }
    return std::min(total, 1.0);
}

double DiscreteDistribution::mean() const {
    double m = 0.0;
    for (std::size_t i = 0; i < values_.size(); ++i) {
        m += values_[i] * probabilities_[i];
    }
    return m;
}

double DiscreteDistribution::variance() const {
    double secondMoment = 0.0;
    for (std::size_t i = 0; i < values_.size(); ++i) {
        secondMoment += values_[i] * values_[i] * probabilities_[i];
    }
    const double m = mean();
    return secondMoment - m * m;
}

std::string DiscreteDistribution::describe() const {
    std::ostringstream oss;
    oss << "Discrete(" << values_.size() << " values, mean=" << mean() << ")";
    return oss.str();
}

} // namespace cyberrisk
