#include "controls/ControlEffectivenessModel.hpp"
#include "exceptions/Exceptions.hpp"
#include "utils/Logger.hpp"
#include <sstream>

namespace cyberrisk {

namespace {

    constexpr double RANK_THRESHOLD = 1e-10;

    double rSquared(const Eigen::VectorXd& observed, const Eigen::VectorXd& fitted) {
        const double ssRes = (observed - fitted).squaredNorm();
        const double ssTot = (observed.array() - observed.mean()).matrix().squaredNorm();
        if (ssTot <= 0.0) {
            return ssRes <= 0.0 ? 1.0 : 0.0;
        }
        return 1.0 - ssRes / ssTot;
    }

} // namespace

    double ControlEffectivenessFit::predictEffect(const Eigen::VectorXd& deployment) const {
        if (deployment.size() != effectCoefficients.size()) {
            THROW_INVALID_PARAM("ControlEffectivenessFit::predictEffect",
                "deployment has " + std::to_string(deployment.size()) + " entries, expected " +
                std::to_string(effectCoefficients.size()) + ".");
        }
        return effectIntercept + effectCoefficients.dot(deployment);
    }

    double ControlEffectivenessFit::predictLoad(const Eigen::VectorXd& deployment) const {
        if (deployment.size() != loadCoefficients.size()) {
            THROW_INVALID_PARAM("ControlEffectivenessFit::predictLoad",
                "deployment has " + std::to_string(deployment.size()) + " entries, expected " +
                std::to_string(loadCoefficients.size()) + ".");
        }
        return loadIntercept + loadCoefficients.dot(deployment);
    }

    ControlEffectivenessModel::ControlEffectivenessModel(bool fitIntercept_)
        : fitIntercept(fitIntercept_) {}

    ControlEffectivenessFit ControlEffectivenessModel::fit(const ControlDeploymentMatrix& history) const {
        const std::string F_NAME = "ControlEffectivenessModel::fit";
        history.validate();

        const Eigen::Index k = history.numControls();
        const Eigen::Index n = history.numPeriods();
        if (n < k + 1) {
            THROW_INVALID_PARAM(F_NAME, "need at least " + std::to_string(k + 1) + " periods for " +
                                std::to_string(k) + " control types, got " + std::to_string(n) + ".");
        }

        const Eigen::Index offset = fitIntercept ? 1 : 0;
        Eigen::MatrixXd design(n, k + offset);
        if (fitIntercept) {
            design.col(0).setOnes();
        }
        design.rightCols(k) = history.counts.transpose();

        Eigen::ColPivHouseholderQR<Eigen::MatrixXd> qr(design);
        qr.setThreshold(RANK_THRESHOLD);
        if (qr.rank() < design.cols()) {
            std::ostringstream oss;
            oss << "design matrix is singular (rank " << qr.rank() << " of " << design.cols()
                << " columns); control counts are collinear";
            if (fitIntercept) {
                oss << " with the intercept";
            }
            THROW_INVALID_PARAM(F_NAME, oss.str());
        }

        const Eigen::VectorXd effectWeights = qr.solve(history.safeguardEffects);
        const Eigen::VectorXd loadWeights = qr.solve(history.maintenanceLoads);

        ControlEffectivenessFit result;
        result.hasIntercept = fitIntercept;
        result.observations = n;
        result.effectCoefficients = effectWeights.tail(k);
        result.loadCoefficients = loadWeights.tail(k);
        if (fitIntercept) {
            result.effectIntercept = effectWeights(0);
            result.loadIntercept = loadWeights(0);
        }
        result.effectRSquared = rSquared(history.safeguardEffects, design * effectWeights);
        result.loadRSquared = rSquared(history.maintenanceLoads, design * loadWeights);

        std::ostringstream oss;
        oss << "Fitted " << k << " controls over " << n << " periods, R^2 effect=" << result.effectRSquared
            << ", load=" << result.loadRSquared;
        Logger::getInstance().debug(F_NAME, oss.str());
        return result;
    }

} // namespace cyberrisk
