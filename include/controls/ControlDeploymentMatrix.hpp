#ifndef CONTROL_DEPLOYMENT_MATRIX_HPP
#define CONTROL_DEPLOYMENT_MATRIX_HPP

#include <Eigen/Dense>
#include <string>
#include <vector>

namespace cyberrisk {

/**
 * @brief Historical control deployment counts and the effects observed with them.
 *
 * counts is (control types x periods); safeguardEffects and maintenanceLoads hold one
 * observation per period.
 */
struct ControlDeploymentMatrix {
    Eigen::MatrixXd counts;
    Eigen::VectorXd safeguardEffects;
    Eigen::VectorXd maintenanceLoads;
    std::vector<std::string> controlNames;   ///< Optional, one per control type.

    Eigen::Index numControls() const { return counts.rows(); }
    Eigen::Index numPeriods() const { return counts.cols(); }

    /**
     * @throws InvalidParameterException if there is no control type, fewer than two
     *         periods, mismatched sequence lengths, negative counts, non-finite values
     *         or a name list of the wrong length.
     */
    void validate() const;

    /** @brief Name of control i, or "Control Type i+1" when none was given. */
    std::string nameOf(Eigen::Index i) const;
};

} // namespace cyberrisk

#endif // CONTROL_DEPLOYMENT_MATRIX_HPP
