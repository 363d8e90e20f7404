#ifndef LOSS_EXPECTANCY_SIMULATOR_HPP
#define LOSS_EXPECTANCY_SIMULATOR_HPP

#include "simulation/ScenarioParameters.hpp"
#include "simulation/SimulationResult.hpp"
#include "simulation/CancellationToken.hpp"
#include "distributions/TriangularDistribution.hpp"
#include "distributions/DiscreteDistribution.hpp"
#include "distributions/LogNormalDistribution.hpp"
#include "distributions/ParetoDistribution.hpp"

namespace cyberrisk {

/**
 * @class LossExpectancySimulator
 * @brief Monte Carlo estimate of the annualized loss expectancy of one scenario.
 *
 * Each run constructs its own RandomGenerator from the scenario seed and draws, in this
 * order, n asset values, n occurrence counts, n log-normal losses and n Pareto losses.
 * The per-iteration annual loss is asset value x (log-normal + Pareto) x occurrences.
 * run() is const and holds no mutable state, so one simulator may serve concurrent runs.
 */
class LossExpectancySimulator {
public:
    /**
     * @brief Validate the scenario and build its distributions.
     * @param parameters Scenario to simulate.
     * @throws InvalidParameterException if the scenario violates any invariant.
     */
    explicit LossExpectancySimulator(ScenarioParameters parameters);

    /**
     * @brief Run the simulation.
     *
     * @param cancellation Optional token polled between phases.
     * @return SimulationResult The aggregate metrics of the run.
     * @throws SimulationCancelledException if cancellation is requested before the run
     *         completes. No partial result is produced.
     */
    SimulationResult run(const CancellationToken* cancellation = nullptr) const;

    const ScenarioParameters& getParameters() const { return parameters_; }

private:
    ScenarioParameters parameters_;
    TriangularDistribution assetValue_;
    DiscreteDistribution occurrences_;
    LogNormalDistribution lossA_;
    ParetoDistribution lossB_;
};

} // namespace cyberrisk

#endif // LOSS_EXPECTANCY_SIMULATOR_HPP
