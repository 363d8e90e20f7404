#ifndef RANDOM_GENERATOR_HPP
#define RANDOM_GENERATOR_HPP

#include <gsl/gsl_rng.h>
#include <optional>

namespace cyberrisk {

/**
 * @brief Owns one GSL Mersenne-Twister instance for a single engine call.
 *
 * Every simulation run constructs its own generator, so concurrent runs never share
 * generator state. Two generators built from the same seed yield the same stream.
 */
class RandomGenerator {
public:
    /**
     * @brief Allocates and seeds the generator.
     * @param seed Explicit seed; when empty a seed is drawn from std::random_device.
     * @throws std::runtime_error if GSL cannot allocate the generator.
     */
    explicit RandomGenerator(std::optional<unsigned long> seed = std::nullopt);

    ~RandomGenerator();

    RandomGenerator(const RandomGenerator&) = delete;
    RandomGenerator& operator=(const RandomGenerator&) = delete;
    RandomGenerator(RandomGenerator&& other) noexcept;
    RandomGenerator& operator=(RandomGenerator&& other) noexcept;

    /** @brief Uniform draw on [0, 1). */
    double uniform();

    /** @brief Uniform draw on (0, 1). */
    double uniformPositive();

    /**
     * @brief The seed as requested, or as drawn when none was given.
     *
     * GSL's mt19937 keys its state on the low 32 bits of the seed and replaces a seed
     * of 0 with its default 4357, so seeds 0 and 4357 (and any two seeds that agree
     * in their low 32 bits) produce the same stream. The value returned here is the
     * requested one, not the substituted one.
     */
    unsigned long getSeed() const noexcept { return seed_; }

    /** @brief Raw handle for the gsl_ran_* samplers. */
    gsl_rng* get() const noexcept { return rng_; }

private:
    gsl_rng* rng_;
    unsigned long seed_;
};

} // namespace cyberrisk

#endif // RANDOM_GENERATOR_HPP
