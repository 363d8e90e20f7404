#ifndef OPTIMIZATION_SPEC_HPP
#define OPTIMIZATION_SPEC_HPP

#include "controls/ControlEffectivenessModel.hpp"
#include "controls/LinearProgram.hpp"
#include <Eigen/Dense>
#include <string>

namespace cyberrisk {

    /**
     * @brief Targets and bounds for the minimum-cost control addition problem.
     *
     * additionLimits bound the units added per control type (0 <= delta_i <= limit_i);
     * +infinity leaves a type unbounded.
     */
    struct OptimizationSpec {
        Eigen::VectorXd currentDeployment;
        Eigen::VectorXd unitCosts;
        Eigen::VectorXd additionLimits;
        double safeguardTarget = 0.0;
        double maintenanceLimit = 0.0;

        /**
         * @brief Build a spec from total per-type deployment caps.
         *
         * Each addition limit becomes max(0, cap - current).
         * @throws InvalidParameterException if the vectors differ in length.
         */
        static OptimizationSpec fromDeploymentCaps(const Eigen::VectorXd& currentDeployment,
                                                   const Eigen::VectorXd& unitCosts,
                                                   const Eigen::VectorXd& deploymentCaps,
                                                   double safeguardTarget,
                                                   double maintenanceLimit);

        /**
         * @param numControls Number of control types the fitted model covers.
         * @throws InvalidParameterException on a length mismatch, negative or non-finite
         *         current counts or costs, negative or NaN limits, or non-finite targets.
         */
        void validate(Eigen::Index numControls) const;
    };

    /**
     * @brief Recommended control additions. Infeasibility is a status, not an error.
     *
     * When the status is not Optimal, additionalUnits is empty and the cost is zero.
     */
    struct OptimizationResult {
        SolverStatus status = SolverStatus::Infeasible;
        Eigen::VectorXd additionalUnits;
        double totalAdditionalCost = 0.0;
        double projectedSafeguardEffect = 0.0;
        double projectedMaintenanceLoad = 0.0;
        ControlEffectivenessFit fit;
        std::string message;

        bool isOptimal() const { return status == SolverStatus::Optimal; }

        /** @brief True if any recommended addition is not a whole number of units. */
        bool hasFractionalUnits(double tolerance = 1e-6) const;
    };

} // namespace cyberrisk

#endif // OPTIMIZATION_SPEC_HPP
