#include "core/RiskAnalysisService.hpp"
#include "simulation/LossExpectancySimulator.hpp"
#include "probability/MarginalDetectionModel.hpp"
#include "controls/ControlOptimizer.hpp"
#include <utility>

namespace cyberrisk {

    SimulationResult RiskAnalysisService::runSimulation(const ScenarioParameters& parameters,
                                                        const CancellationToken* cancellation) {
        LossExpectancySimulator simulator(parameters);
        return simulator.run(cancellation);
    }

    ConditionalProbabilityResult RiskAnalysisService::evaluateConditionalProbabilities(
        const JointObservationTable& table,
        const std::vector<double>& detectionRates,
        const ConditionalQuery& query) {
        const MarginalDetectionModel detection = MarginalDetectionModel::fromRateList(detectionRates, table);
        return evaluateConditionalProbabilities(table, detection, query);
    }

    ConditionalProbabilityResult RiskAnalysisService::evaluateConditionalProbabilities(
        const JointObservationTable& table,
        const IDetectionModel& detection,
        const ConditionalQuery& query) {
        ConditionalProbabilityEvaluator evaluator(table);
        return evaluator.evaluate(query, detection);
    }

    OptimizationResult RiskAnalysisService::optimizeControls(const ControlDeploymentMatrix& history,
                                                             const OptimizationSpec& spec,
                                                             bool fitIntercept,
                                                             std::shared_ptr<ILinearProgramSolver> solver) {
        ControlOptimizer optimizer(std::move(solver), fitIntercept);
        return optimizer.optimize(history, spec);
    }

} // namespace cyberrisk
