#ifndef RISK_CONSTANTS_HPP
#define RISK_CONSTANTS_HPP

#include <array>
#include <cstddef>

namespace cyberrisk {
namespace constants {

    constexpr double PROBABILITY_SUM_TOLERANCE = 1e-6;
    constexpr double NUMERICAL_EPSILON = 1e-9;

    constexpr std::size_t MAX_SIMULATION_ITERATIONS = 10000000;

    constexpr std::array<double, 5> PERCENTILE_LEVELS = {0.50, 0.75, 0.90, 0.95, 0.99};

    constexpr int DEFAULT_SIMPLEX_MAX_ITERATIONS = 10000;
    constexpr double DEFAULT_SIMPLEX_TOLERANCE = 1e-9;

    constexpr double RECOMMENDATION_MIN_UNITS = 0.01;
    constexpr double HIGH_PRIORITY_UNITS = 2.0;
    constexpr double MEDIUM_PRIORITY_UNITS = 1.0;
    constexpr double ROI_HORIZON_YEARS = 3.0;

} // namespace constants
} // namespace cyberrisk

#endif // RISK_CONSTANTS_HPP
