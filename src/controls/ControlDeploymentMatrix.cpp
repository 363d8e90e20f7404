#include "controls/ControlDeploymentMatrix.hpp"
#include "exceptions/Exceptions.hpp"

namespace cyberrisk {

void ControlDeploymentMatrix::validate() const {
    const std::string F_NAME = "ControlDeploymentMatrix::validate";
    if (numControls() == 0) {
        THROW_INVALID_PARAM(F_NAME, "at least one control type is required.");
    }
    if (numPeriods() < 2) {
        THROW_INVALID_PARAM(F_NAME, "at least two observation periods are required, got " +
                            std::to_string(numPeriods()) + ".");
    }
    if (safeguardEffects.size() != numPeriods() || maintenanceLoads.size() != numPeriods()) {
        THROW_INVALID_PARAM(F_NAME, "counts cover " + std::to_string(numPeriods()) + " periods but got " +
                            std::to_string(safeguardEffects.size()) + " safeguard effects and " +
                            std::to_string(maintenanceLoads.size()) + " maintenance loads.");
    }
    if (!counts.allFinite() || !safeguardEffects.allFinite() || !maintenanceLoads.allFinite()) {
        THROW_INVALID_PARAM(F_NAME, "deployment history contains non-finite values.");
    }
    if ((counts.array() < 0.0).any()) {
        THROW_INVALID_PARAM(F_NAME, "deployment counts must be >= 0.");
    }
    if (!controlNames.empty() && static_cast<Eigen::Index>(controlNames.size()) != numControls()) {
        THROW_INVALID_PARAM(F_NAME, "got " + std::to_string(controlNames.size()) + " control names for " +
                            std::to_string(numControls()) + " control types.");
    }
}

std::string ControlDeploymentMatrix::nameOf(Eigen::Index i) const {
    if (i >= 0 && static_cast<std::size_t>(i) < controlNames.size()) {
        return controlNames[static_cast<std::size_t>(i)];
    }
    return "Control Type " + std::to_string(i + 1);
}

} // namespace cyberrisk
