#include "controls/OptimizationSpec.hpp"
#include "exceptions/Exceptions.hpp"
#include <cmath>

namespace cyberrisk {

    OptimizationSpec OptimizationSpec::fromDeploymentCaps(const Eigen::VectorXd& currentDeployment,
                                                          const Eigen::VectorXd& unitCosts,
                                                          const Eigen::VectorXd& deploymentCaps,
                                                          double safeguardTarget,
                                                          double maintenanceLimit) {
        if (deploymentCaps.size() != currentDeployment.size()) {
            THROW_INVALID_PARAM("OptimizationSpec::fromDeploymentCaps",
                "got " + std::to_string(deploymentCaps.size()) + " caps for " +
                std::to_string(currentDeployment.size()) + " control types.");
        }
        OptimizationSpec spec;
        spec.currentDeployment = currentDeployment;
        spec.unitCosts = unitCosts;
        spec.additionLimits = (deploymentCaps - currentDeployment).cwiseMax(0.0);
        spec.safeguardTarget = safeguardTarget;
        spec.maintenanceLimit = maintenanceLimit;
        return spec;
    }

    void OptimizationSpec::validate(Eigen::Index numControls) const {
        const std::string F_NAME = "OptimizationSpec::validate";
        if (currentDeployment.size() != numControls || unitCosts.size() != numControls ||
            additionLimits.size() != numControls) {
            THROW_INVALID_PARAM(F_NAME, "expected " + std::to_string(numControls) +
                " entries each, got current=" + std::to_string(currentDeployment.size()) +
                ", costs=" + std::to_string(unitCosts.size()) +
                ", limits=" + std::to_string(additionLimits.size()) + ".");
        }
        for (Eigen::Index i = 0; i < numControls; ++i) {
            if (!std::isfinite(currentDeployment(i)) || currentDeployment(i) < 0.0) {
                THROW_INVALID_PARAM(F_NAME, "current deployment of control " + std::to_string(i) +
                                    " must be finite and >= 0.");
            }
            if (!std::isfinite(unitCosts(i)) || unitCosts(i) < 0.0) {
                THROW_INVALID_PARAM(F_NAME, "unit cost of control " + std::to_string(i) +
                                    " must be finite and >= 0.");
            }
            if (std::isnan(additionLimits(i)) || additionLimits(i) < 0.0) {
                THROW_INVALID_PARAM(F_NAME, "addition limit of control " + std::to_string(i) + " is " +
                                    std::to_string(additionLimits(i)) + ", expected a value >= 0.");
            }
        }
        if (!std::isfinite(safeguardTarget) || !std::isfinite(maintenanceLimit)) {
            THROW_INVALID_PARAM(F_NAME, "safeguard target and maintenance limit must be finite.");
        }
    }

    bool OptimizationResult::hasFractionalUnits(double tolerance) const {
        for (Eigen::Index i = 0; i < additionalUnits.size(); ++i) {
            if (std::abs(additionalUnits(i) - std::round(additionalUnits(i))) > tolerance) {
                return true;
            }
        }
        return false;
    }

} // namespace cyberrisk
