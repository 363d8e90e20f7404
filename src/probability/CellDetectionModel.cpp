#include "probability/CellDetectionModel.hpp"
#include "exceptions/Exceptions.hpp"
#include <cmath>
#include <sstream>

namespace cyberrisk {

CellDetectionModel::CellDetectionModel(const Eigen::MatrixXd& likelihoods_)
    : likelihoods(likelihoods_)
{
    for (Eigen::Index r = 0; r < likelihoods.rows(); ++r) {
        for (Eigen::Index c = 0; c < likelihoods.cols(); ++c) {
            const double p = likelihoods(r, c);
            if (!std::isfinite(p) || p < 0.0 || p > 1.0) {
                std::ostringstream oss;
                oss << "likelihood at (" << r << ", " << c << ") is " << p << ", expected a value in [0, 1]";
                THROW_INVALID_PARAM("CellDetectionModel", oss.str());
            }
        }
    }
}

Eigen::VectorXd CellDetectionModel::positiveMassByY(const JointObservationTable& table) const {
    if (likelihoods.rows() != table.rows() || likelihoods.cols() != table.cols()) {
        THROW_INVALID_PARAM("CellDetectionModel::positiveMassByY",
            "likelihoods are " + std::to_string(likelihoods.rows()) + " x " + std::to_string(likelihoods.cols()) +
            " but the table is " + std::to_string(table.rows()) + " x " + std::to_string(table.cols()) + ".");
    }
    const Eigen::MatrixXd joint = table.getCounts().cast<double>() / static_cast<double>(table.getTotalTrials());
    return joint.cwiseProduct(likelihoods).rowwise().sum();
}

std::string CellDetectionModel::describe() const {
    return "CellDetectionModel(" + std::to_string(likelihoods.rows()) + " x " +
           std::to_string(likelihoods.cols()) + " likelihoods)";
}

} // namespace cyberrisk
