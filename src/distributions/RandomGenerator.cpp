#include "distributions/RandomGenerator.hpp"
#include <random>
#include <stdexcept>
#include <utility>

namespace cyberrisk {

RandomGenerator::RandomGenerator(std::optional<unsigned long> seed)
    : rng_(nullptr),
      seed_(seed ? *seed : static_cast<unsigned long>(std::random_device{}()))
{
    rng_ = gsl_rng_alloc(gsl_rng_mt19937);
    if (!rng_) {
        throw std::runtime_error("Failed to allocate GSL RNG.");
    }
    gsl_rng_set(rng_, seed_);
}

RandomGenerator::~RandomGenerator() {
    if (rng_) gsl_rng_free(rng_);
}

RandomGenerator::RandomGenerator(RandomGenerator&& other) noexcept
    : rng_(std::exchange(other.rng_, nullptr)), seed_(other.seed_) {}

RandomGenerator& RandomGenerator::operator=(RandomGenerator&& other) noexcept {
    if (this != &other) {
        if (rng_) gsl_rng_free(rng_);
        rng_ = std::exchange(other.rng_, nullptr);
        seed_ = other.seed_;
    }
    return *this;
}

double RandomGenerator::uniform() {
    return gsl_rng_uniform(rng_);
}

double RandomGenerator::uniformPositive() {
    return gsl_rng_uniform_pos(rng_);
}

} // namespace cyberrisk
