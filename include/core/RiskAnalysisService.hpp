#ifndef RISK_ANALYSIS_SERVICE_HPP
#define RISK_ANALYSIS_SERVICE_HPP

#include "simulation/ScenarioParameters.hpp"
#include "simulation/SimulationResult.hpp"
#include "simulation/CancellationToken.hpp"
#include "probability/JointObservationTable.hpp"
#include "probability/ConditionalProbabilityEvaluator.hpp"
#include "probability/interfaces/IDetectionModel.hpp"
#include "controls/ControlDeploymentMatrix.hpp"
#include "controls/OptimizationSpec.hpp"
#include "controls/interfaces/ILinearProgramSolver.hpp"
#include <memory>
#include <vector>

namespace cyberrisk {

    /**
     * @class RiskAnalysisService
     * @brief Entry points of the three analysis engines.
     *
     * Every call is independent and holds no state, so calls may run concurrently.
     * Invalid input raises InvalidParameterException; an undefined conditional query
     * raises DivisionByZeroException; LP infeasibility is reported in the result.
     */
    class RiskAnalysisService {
    public:
        RiskAnalysisService() = delete;

        /**
         * @brief Monte Carlo loss-expectancy simulation of one scenario.
         * @throws InvalidParameterException before sampling if the scenario is invalid.
         * @throws SimulationCancelledException if the token is cancelled mid-run.
         */
        static SimulationResult runSimulation(const ScenarioParameters& parameters,
                                              const CancellationToken* cancellation = nullptr);

        /**
         * @brief Conditional queries with detection rates per X level and all but the last Y level.
         *
         * For the default table the rates are
         * [P(T|X=2), P(T|X=3), P(T|X=4), P(T|X=5), P(T|Y=6), P(T|Y=7)].
         */
        static ConditionalProbabilityResult evaluateConditionalProbabilities(const JointObservationTable& table,
                                                                             const std::vector<double>& detectionRates,
                                                                             const ConditionalQuery& query = ConditionalQuery());

        /** @brief Conditional queries under any detection model. */
        static ConditionalProbabilityResult evaluateConditionalProbabilities(const JointObservationTable& table,
                                                                             const IDetectionModel& detection,
                                                                             const ConditionalQuery& query = ConditionalQuery());

        /**
         * @brief Fit the control-effectiveness model and solve for the cheapest additions.
         * @param solver LP solver to use; a default SimplexSolver when null.
         */
        static OptimizationResult optimizeControls(const ControlDeploymentMatrix& history,
                                                   const OptimizationSpec& spec,
                                                   bool fitIntercept = false,
                                                   std::shared_ptr<ILinearProgramSolver> solver = nullptr);
    };

} // namespace cyberrisk

#endif // RISK_ANALYSIS_SERVICE_HPP
