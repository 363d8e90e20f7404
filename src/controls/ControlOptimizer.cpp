#include "controls/ControlOptimizer.hpp"
#include "controls/solvers/SimplexSolver.hpp"
#include "utils/Logger.hpp"
#include <sstream>
#include <utility>

namespace cyberrisk {

ControlOptimizer::ControlOptimizer(std::shared_ptr<ILinearProgramSolver> solver, bool fitIntercept)
    : solver_(solver ? std::move(solver) : std::make_shared<SimplexSolver>()),
      model_(fitIntercept) {}

LinearProgram ControlOptimizer::buildProgram(const ControlEffectivenessFit& fit, const OptimizationSpec& spec) {
    const Eigen::Index k = fit.effectCoefficients.size();
    spec.validate(k);

    LinearProgram program;
    program.objective = spec.unitCosts;
    program.constraintMatrix.resize(2, k);
    program.constraintMatrix.row(0) = fit.effectCoefficients.transpose();
    program.constraintMatrix.row(1) = fit.loadCoefficients.transpose();
    program.rhs.resize(2);
    // Move the current deployment's contribution to the right-hand side
    program.rhs(0) = spec.safeguardTarget - fit.predictEffect(spec.currentDeployment);
    program.rhs(1) = spec.maintenanceLimit - fit.predictLoad(spec.currentDeployment);
    program.senses = {ConstraintSense::GreaterEqual, ConstraintSense::LessEqual};
    program.upperBounds = spec.additionLimits;
    return program;
}

OptimizationResult ControlOptimizer::optimize(const ControlDeploymentMatrix& history,
                                              const OptimizationSpec& spec) const {
    return optimize(model_.fit(history), spec);
}

OptimizationResult ControlOptimizer::optimize(const ControlEffectivenessFit& fit,
                                              const OptimizationSpec& spec) const {
    const std::string F_NAME = "ControlOptimizer::optimize";
    auto& logger = Logger::getInstance();

    const LinearProgram program = buildProgram(fit, spec);
    std::ostringstream gaps;
    gaps << "Effect gap " << program.rhs(0) << ", load headroom " << program.rhs(1);
    logger.debug(F_NAME, gaps.str());

    const LinearProgramSolution solution = solver_->solve(program);

    OptimizationResult result;
    result.status = solution.status;
    result.fit = fit;
    result.message = solution.message;

    if (!solution.isOptimal()) {
        result.projectedSafeguardEffect = fit.predictEffect(spec.currentDeployment);
        result.projectedMaintenanceLoad = fit.predictLoad(spec.currentDeployment);
        logger.warning(F_NAME, "No optimal deployment (" + toString(solution.status) + "): " + solution.message);
        return result;
    }

    result.additionalUnits = solution.x;
    result.totalAdditionalCost = solution.objectiveValue;
    const Eigen::VectorXd deployed = spec.currentDeployment + solution.x;
    result.projectedSafeguardEffect = fit.predictEffect(deployed);
    result.projectedMaintenanceLoad = fit.predictLoad(deployed);

    std::ostringstream oss;
    oss << "Optimal additions [" << solution.x.transpose() << "] at cost " << result.totalAdditionalCost;
    logger.info(F_NAME, oss.str());
    if (result.hasFractionalUnits()) {
        logger.debug(F_NAME, "Recommended additions include fractional units.");
    }
    return result;
}

} // namespace cyberrisk
