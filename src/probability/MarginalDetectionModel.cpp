#include "probability/MarginalDetectionModel.hpp"
#include "core/RiskConstants.hpp"
#include "exceptions/Exceptions.hpp"
#include <algorithm>
#include <cmath>
#include <sstream>

namespace cyberrisk {

namespace {

    void requireRates(const Eigen::VectorXd& rates, const char* axis) {
        for (Eigen::Index i = 0; i < rates.size(); ++i) {
            if (!std::isfinite(rates(i)) || rates(i) < 0.0 || rates(i) > 1.0) {
                std::ostringstream oss;
                oss << "P(T | " << axis << " level " << i << ") is " << rates(i) << ", expected a value in [0, 1]";
                THROW_INVALID_PARAM("MarginalDetectionModel", oss.str());
            }
        }
    }

} // namespace

MarginalDetectionModel::MarginalDetectionModel(const Eigen::VectorXd& xRates_, const Eigen::VectorXd& yRates_)
    : xRates(xRates_), yRates(yRates_)
{
    requireRates(xRates, "X");
    requireRates(yRates, "Y");
}

MarginalDetectionModel MarginalDetectionModel::fromRateList(const std::vector<double>& rates,
                                                            const JointObservationTable& table) {
    const std::size_t nx = static_cast<std::size_t>(table.cols());
    const std::size_t ny = static_cast<std::size_t>(table.rows()) - 1;
    if (rates.size() != nx + ny) {
        THROW_INVALID_PARAM("MarginalDetectionModel::fromRateList",
            "expected " + std::to_string(nx + ny) + " detection rates (" + std::to_string(nx) +
            " X levels, " + std::to_string(ny) + " Y levels), got " + std::to_string(rates.size()) + ".");
    }
    Eigen::VectorXd x(static_cast<Eigen::Index>(nx));
    Eigen::VectorXd y(static_cast<Eigen::Index>(ny));
    std::copy(rates.begin(), rates.begin() + nx, x.data());
    std::copy(rates.begin() + nx, rates.end(), y.data());
    return MarginalDetectionModel(x, y);
}

void MarginalDetectionModel::checkShape(const JointObservationTable& table) const {
    if (xRates.size() != table.cols() || yRates.size() != table.rows() - 1) {
        THROW_INVALID_PARAM("MarginalDetectionModel::checkShape",
            "rates cover " + std::to_string(xRates.size()) + " X and " + std::to_string(yRates.size()) +
            " Y levels, the table needs " + std::to_string(table.cols()) + " and " +
            std::to_string(table.rows() - 1) + ".");
    }
}

Eigen::VectorXd MarginalDetectionModel::positiveMassByY(const JointObservationTable& table) const {
    checkShape(table);
    const JointTableSummary summary = table.summarize();
    const Eigen::Index last = table.rows() - 1;

    const double pPositive = xRates.dot(summary.colProbabilities);

    Eigen::VectorXd mass(table.rows());
    mass.head(last) = yRates.cwiseProduct(summary.rowProbabilities.head(last));
    mass(last) = pPositive - mass.head(last).sum();

    // The two sides of the total-probability identity must agree on a likelihood in [0, 1]
    const double lastMarginal = summary.rowProbabilities(last);
    if (lastMarginal <= 0.0) {
        THROW_DIVISION_BY_ZERO("MarginalDetectionModel::positiveMassByY",
                               "the last Y level has zero probability, its likelihood is undefined.");
    }
    const double derived = mass(last) / lastMarginal;
    const double tolerance = constants::PROBABILITY_SUM_TOLERANCE;
    if (derived < -tolerance || derived > 1.0 + tolerance) {
        std::ostringstream oss;
        oss << "detection rates are inconsistent: derived P(T | Y = " << table.getYLevels()(last)
            << ") is " << derived << ", expected a value in [0, 1]";
        THROW_INVALID_PARAM("MarginalDetectionModel::positiveMassByY", oss.str());
    }
    mass(last) = std::clamp(derived, 0.0, 1.0) * lastMarginal;
    return mass;
}

double MarginalDetectionModel::derivedLastYLikelihood(const JointObservationTable& table) const {
    const Eigen::VectorXd mass = positiveMassByY(table);
    const Eigen::Index last = table.rows() - 1;
    return mass(last) / table.summarize().rowProbabilities(last);
}

std::string MarginalDetectionModel::describe() const {
    std::ostringstream oss;
    oss << "MarginalDetectionModel(x rates=[" << xRates.transpose() << "], y rates=[" << yRates.transpose() << "])";
    return oss.str();
}

} // namespace cyberrisk
