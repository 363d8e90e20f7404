#include "simulation/ScenarioParameters.hpp"
#include "core/RiskConstants.hpp"
#include "exceptions/Exceptions.hpp"
#include <cmath>
#include <numeric>
#include <sstream>
#include <string>

namespace cyberrisk {

namespace {

    void requireFinite(double value, const char* name) {
        if (!std::isfinite(value)) {
            std::ostringstream oss;
            oss << name << " must be finite, got " << value;
            THROW_INVALID_PARAM("ScenarioParameters::validate", oss.str());
        }
    }

} // namespace

void ScenarioParameters::validate() const {
    const std::string F_NAME = "ScenarioParameters::validate";

    requireFinite(assetValueMin, "asset value min");
    requireFinite(assetValueMode, "asset value mode");
    requireFinite(assetValueMax, "asset value max");
    requireFinite(lossMu, "log-normal mu");
    requireFinite(lossSigma, "log-normal sigma");
    requireFinite(paretoScale, "Pareto scale");
    requireFinite(paretoShape, "Pareto shape");
    requireFinite(assetValueThreshold, "asset value threshold");
    requireFinite(lossExceedanceThreshold, "loss exceedance threshold");
    requireFinite(lossRangeLower, "loss range lower bound");
    requireFinite(lossRangeUpper, "loss range upper bound");

    if (!(assetValueMin <= assetValueMode && assetValueMode <= assetValueMax)) {
        std::ostringstream oss;
        oss << "asset value bounds require min <= mode <= max, got min=" << assetValueMin
            << ", mode=" << assetValueMode << ", max=" << assetValueMax;
        THROW_INVALID_PARAM(F_NAME, oss.str());
    }

    if (occurrenceCounts.empty()) {
        THROW_INVALID_PARAM(F_NAME, "at least one occurrence count is required.");
    }
    if (occurrenceCounts.size() != occurrenceProbabilities.size()) {
        THROW_INVALID_PARAM(F_NAME, "got " + std::to_string(occurrenceCounts.size()) +
                            " occurrence counts but " + std::to_string(occurrenceProbabilities.size()) +
                            " occurrence probabilities.");
    }
    for (std::size_t i = 0; i < occurrenceCounts.size(); ++i) {
        if (!std::isfinite(occurrenceCounts[i]) || occurrenceCounts[i] < 0.0) {
            std::ostringstream oss;
            oss << "occurrence count at index " << i << " is " << occurrenceCounts[i] << ", expected a finite value >= 0";
            THROW_INVALID_PARAM(F_NAME, oss.str());
        }
        if (!std::isfinite(occurrenceProbabilities[i]) || occurrenceProbabilities[i] < 0.0) {
            std::ostringstream oss;
            oss << "occurrence probability at index " << i << " is " << occurrenceProbabilities[i]
                << ", expected a finite value >= 0";
            THROW_INVALID_PARAM(F_NAME, oss.str());
        }
    }
    const double total = std::accumulate(occurrenceProbabilities.begin(), occurrenceProbabilities.end(), 0.0);
    if (std::abs(total - 1.0) > constants::PROBABILITY_SUM_TOLERANCE) {
        std::ostringstream oss;
        oss << "occurrence probabilities sum to " << total << ", expected 1.0 ± "
            << constants::PROBABILITY_SUM_TOLERANCE;
        THROW_INVALID_PARAM(F_NAME, oss.str());
    }

    if (lossSigma <= 0.0) {
        THROW_INVALID_PARAM(F_NAME, "log-normal sigma must be > 0, got " + std::to_string(lossSigma));
    }
    if (paretoScale <= 0.0) {
        THROW_INVALID_PARAM(F_NAME, "Pareto scale must be > 0, got " + std::to_string(paretoScale));
    }
    if (paretoShape <= 0.0) {
        THROW_INVALID_PARAM(F_NAME, "Pareto shape must be > 0, got " + std::to_string(paretoShape));
    }

    if (lossRangeLower > lossRangeUpper) {
        std::ostringstream oss;
        oss << "loss range requires lower <= upper, got [" << lossRangeLower << ", " << lossRangeUpper << "]";
        THROW_INVALID_PARAM(F_NAME, oss.str());
    }

    if (iterations < 1 || iterations > constants::MAX_SIMULATION_ITERATIONS) {
        THROW_INVALID_PARAM(F_NAME, "iterations must be in [1, " +
                            std::to_string(constants::MAX_SIMULATION_ITERATIONS) + "], got " +
                            std::to_string(iterations));
    }
}

} // namespace cyberrisk
