#ifndef CONTROL_EFFECTIVENESS_MODEL_HPP
#define CONTROL_EFFECTIVENESS_MODEL_HPP

#include "controls/ControlDeploymentMatrix.hpp"
#include <Eigen/Dense>

namespace cyberrisk {

    /**
     * @brief Fitted linear models of safeguard effect and maintenance load.
     *
     * effect(d) = effectIntercept + effectCoefficients . d, likewise for load. Intercepts
     * are zero unless the model was fitted with one.
     */
    struct ControlEffectivenessFit {
        Eigen::VectorXd effectCoefficients;
        Eigen::VectorXd loadCoefficients;
        double effectIntercept = 0.0;
        double loadIntercept = 0.0;
        bool hasIntercept = false;
        double effectRSquared = 0.0;
        double loadRSquared = 0.0;
        Eigen::Index observations = 0;

        /** @throws InvalidParameterException if deployment has the wrong length. */
        double predictEffect(const Eigen::VectorXd& deployment) const;
        /** @throws InvalidParameterException if deployment has the wrong length. */
        double predictLoad(const Eigen::VectorXd& deployment) const;
    };

    /**
     * @class ControlEffectivenessModel
     * @brief Ordinary least squares fit of effect and load on per-period control counts.
     *
     * Solved by column-pivoting Householder QR. A rank-deficient design is rejected
     * rather than resolved to a minimum-norm solution.
     */
    class ControlEffectivenessModel {
    public:
        /**
         * @param fitIntercept Add a constant column to the design matrix.
         */
        explicit ControlEffectivenessModel(bool fitIntercept = false);

        /**
         * @brief Fit both models.
         *
         * @param history Historical deployments with one effect and load per period.
         * @return ControlEffectivenessFit Coefficients and R^2 of both fits.
         * @throws InvalidParameterException if the history is invalid, has fewer periods
         *         than control types + 1, or the design matrix is singular.
         */
        ControlEffectivenessFit fit(const ControlDeploymentMatrix& history) const;

        bool fitsIntercept() const { return fitIntercept; }

    private:
        bool fitIntercept;
    };

} // namespace cyberrisk

#endif // CONTROL_EFFECTIVENESS_MODEL_HPP
