#include "probability/ConditionalProbabilityEvaluator.hpp"
#include "exceptions/Exceptions.hpp"
#include "utils/Logger.hpp"
#include <algorithm>
#include <sstream>

namespace cyberrisk {

    ConditionalProbabilityEvaluator::ConditionalProbabilityEvaluator(const JointObservationTable& table_)
        : table(table_) {}

    double ConditionalProbabilityEvaluator::marginalProbabilityY(double y) const {
        const Eigen::Index row = table.rowOfY(y);
        return static_cast<double>(table.getCounts().row(row).sum()) / static_cast<double>(table.getTotalTrials());
    }

    double ConditionalProbabilityEvaluator::marginalProbabilityX(double x) const {
        const Eigen::Index col = table.colOfX(x);
        return static_cast<double>(table.getCounts().col(col).sum()) / static_cast<double>(table.getTotalTrials());
    }

    double ConditionalProbabilityEvaluator::probabilityXWithin(double lower, double upper) const {
        const Eigen::VectorXd& xs = table.getXLevels();
        long hits = 0;
        for (Eigen::Index c = 0; c < table.cols(); ++c) {
            if (xs(c) >= lower && xs(c) <= upper) {
                hits += table.getCounts().col(c).sum();
            }
        }
        return static_cast<double>(hits) / static_cast<double>(table.getTotalTrials());
    }

    double ConditionalProbabilityEvaluator::probabilityOfSumWithin(double lower, double upper) const {
        const Eigen::VectorXd& xs = table.getXLevels();
        const Eigen::VectorXd& ys = table.getYLevels();
        long hits = 0;
        for (Eigen::Index r = 0; r < table.rows(); ++r) {
            for (Eigen::Index c = 0; c < table.cols(); ++c) {
                const double s = xs(c) + ys(r);
                if (s >= lower && s <= upper) {
                    hits += table.getCounts()(r, c);
                }
            }
        }
        return static_cast<double>(hits) / static_cast<double>(table.getTotalTrials());
    }

    double ConditionalProbabilityEvaluator::probabilityOfDetection(const IDetectionModel& detection) const {
        return detection.positiveMassByY(table).sum();
    }

    double ConditionalProbabilityEvaluator::posteriorY(double y, const IDetectionModel& detection) const {
        const Eigen::Index row = table.rowOfY(y);
        const Eigen::VectorXd mass = detection.positiveMassByY(table);
        const double evidence = mass.sum();
        if (evidence <= 0.0) {
            THROW_DIVISION_BY_ZERO("ConditionalProbabilityEvaluator::posteriorY",
                                   "P(T = positive) is zero, the posterior is undefined.");
        }
        return std::clamp(mass(row) / evidence, 0.0, 1.0);
    }

    ConditionalProbabilityResult ConditionalProbabilityEvaluator::evaluate(const ConditionalQuery& query,
                                                                           const IDetectionModel& detection) const {
        const std::string F_NAME = "ConditionalProbabilityEvaluator::evaluate";
        Logger::getInstance().debug(F_NAME, "Evaluating with " + detection.describe() + ".");

        ConditionalProbabilityResult result;
        result.pMarginal = marginalProbabilityY(query.marginalYLevel);
        result.pRange = probabilityOfSumWithin(query.sumLower, query.sumUpper);
        result.pXRange = probabilityXWithin(query.xRangeLower, query.xRangeUpper);
        result.pDetection = probabilityOfDetection(detection);
        result.pConditional = posteriorY(query.posteriorYLevel, detection);

        std::ostringstream oss;
        oss << "P(Y=" << query.marginalYLevel << ")=" << result.pMarginal
            << ", P(X+Y in range)=" << result.pRange
            << ", P(Y=" << query.posteriorYLevel << "|T)=" << result.pConditional;
        Logger::getInstance().info(F_NAME, oss.str());
        return result;
    }

    double ConditionalProbabilityEvaluator::conditionalProbability(double joint, double marginal) {
        if (marginal == 0.0) {
            THROW_DIVISION_BY_ZERO("ConditionalProbabilityEvaluator::conditionalProbability",
                                   "marginal probability is zero.");
        }
        return joint / marginal;
    }

    double ConditionalProbabilityEvaluator::bayesPosterior(double prior, double likelihood, double evidence) {
        if (evidence == 0.0) {
            THROW_DIVISION_BY_ZERO("ConditionalProbabilityEvaluator::bayesPosterior",
                                   "evidence probability is zero.");
        }
        return likelihood * prior / evidence;
    }

} // namespace cyberrisk
