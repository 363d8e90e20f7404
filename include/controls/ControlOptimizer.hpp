#ifndef CONTROL_OPTIMIZER_HPP
#define CONTROL_OPTIMIZER_HPP

#include "controls/ControlDeploymentMatrix.hpp"
#include "controls/ControlEffectivenessModel.hpp"
#include "controls/OptimizationSpec.hpp"
#include "controls/interfaces/ILinearProgramSolver.hpp"
#include <memory>

namespace cyberrisk {

/**
 * @class ControlOptimizer
 * @brief Minimum-cost additional control deployment meeting effect and load targets.
 *
 * Solves
 *   minimize    sum_i cost_i * delta_i
 *   subject to  effect(current + delta) >= safeguardTarget
 *               load(current + delta)   <= maintenanceLimit
 *               0 <= delta_i <= limit_i
 * over continuous delta, with effect and load from a ControlEffectivenessFit.
 */
class ControlOptimizer {
public:
    /**
     * @param solver LP solver; a default SimplexSolver is used when null.
     * @param fitIntercept Passed to the ControlEffectivenessModel used by optimize(history, spec).
     */
    explicit ControlOptimizer(std::shared_ptr<ILinearProgramSolver> solver = nullptr,
                              bool fitIntercept = false);

    /**
     * @brief Fit the effectiveness model on the history, then solve.
     * @throws InvalidParameterException if the history or the OptimizationSpec is invalid, or the
     *         regression is singular.
     */
    OptimizationResult optimize(const ControlDeploymentMatrix& history, const OptimizationSpec& spec) const;

    /**
     * @brief Solve against an already fitted model.
     * @throws InvalidParameterException if the OptimizationSpec does not match the fit.
     */
    OptimizationResult optimize(const ControlEffectivenessFit& fit, const OptimizationSpec& spec) const;

    /** @brief The linear program optimize() would solve for this fit and spec. */
    static LinearProgram buildProgram(const ControlEffectivenessFit& fit, const OptimizationSpec& spec);

private:
    std::shared_ptr<ILinearProgramSolver> solver_;
    ControlEffectivenessModel model_;
};

} // namespace cyberrisk

#endif // CONTROL_OPTIMIZER_HPP
