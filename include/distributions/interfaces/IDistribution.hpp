#ifndef I_DISTRIBUTION_HPP
#define I_DISTRIBUTION_HPP

#include "distributions/RandomGenerator.hpp"
#include <cstddef>
#include <string>
#include <vector>

namespace cyberrisk {

/**
 * @brief Interface for the closed-form distributions used by the simulator.
 *
 * Implementations are immutable once constructed and validate their parameters in the
 * constructor. Sampling draws from the caller's generator only, so a fixed call order
 * against one seeded generator reproduces the same sequence.
 */
class IDistribution {
public:
    virtual ~IDistribution() = default;

    /**
     * @brief Draw n independent samples.
     * @param rng Generator owned by the current engine call.
     * @param n Number of draws.
     * @return std::vector<double> The draws, in generation order.
     */
    virtual std::vector<double> sample(RandomGenerator& rng, std::size_t n) const = 0;

    /** @brief P(X <= x). */
    virtual double cdf(double x) const = 0;

    virtual double mean() const = 0;

    virtual double variance() const = 0;

    /** @brief Short description including parameters, used in log output. */
    virtual std::string describe() const = 0;
};

} // namespace cyberrisk

#endif // I_DISTRIBUTION_HPP
