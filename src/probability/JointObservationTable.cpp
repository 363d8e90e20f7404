#include "probability/JointObservationTable.hpp"
#include "exceptions/Exceptions.hpp"
#include <cmath>
#include <sstream>

namespace cyberrisk {

namespace {

    constexpr double LEVEL_MATCH_TOLERANCE = 1e-9;

    Eigen::Index findLevel(const Eigen::VectorXd& levels, double value, const char* axis) {
        for (Eigen::Index i = 0; i < levels.size(); ++i) {
            if (std::abs(levels(i) - value) <= LEVEL_MATCH_TOLERANCE) {
                return i;
            }
        }
        std::ostringstream oss;
        oss << axis << " level " << value << " is not a level of the table.";
        THROW_INVALID_PARAM("JointObservationTable::findLevel", oss.str());
    }

    void requireDistinct(const Eigen::VectorXd& levels, const char* axis) {
        for (Eigen::Index i = 0; i < levels.size(); ++i) {
            if (!std::isfinite(levels(i))) {
                THROW_INVALID_PARAM("JointObservationTable", std::string(axis) + " levels must be finite.");
            }
            for (Eigen::Index j = i + 1; j < levels.size(); ++j) {
                if (std::abs(levels(i) - levels(j)) <= LEVEL_MATCH_TOLERANCE) {
                    std::ostringstream oss;
                    oss << axis << " level " << levels(i) << " appears more than once.";
                    THROW_INVALID_PARAM("JointObservationTable", oss.str());
                }
            }
        }
    }

} // namespace

    JointObservationTable::JointObservationTable(const Eigen::MatrixXi& counts_, long totalTrials_)
        : counts(counts_), totalTrials(totalTrials_),
          xLevels(defaultXLevels()), yLevels(defaultYLevels())
    {
        if (counts.rows() != yLevels.size() || counts.cols() != xLevels.size()) {
            THROW_INVALID_PARAM("JointObservationTable",
                "default levels need a 3 x 4 table, got " + std::to_string(counts.rows()) + " x " +
                std::to_string(counts.cols()) + "; pass explicit levels for other shapes.");
        }
        validate();
    }

    JointObservationTable::JointObservationTable(const Eigen::MatrixXi& counts_, long totalTrials_,
                                                 const Eigen::VectorXd& xLevels_, const Eigen::VectorXd& yLevels_)
        : counts(counts_), totalTrials(totalTrials_), xLevels(xLevels_), yLevels(yLevels_)
    {
        if (counts.rows() != yLevels.size() || counts.cols() != xLevels.size()) {
            THROW_INVALID_PARAM("JointObservationTable",
                "table is " + std::to_string(counts.rows()) + " x " + std::to_string(counts.cols()) +
                " but got " + std::to_string(yLevels.size()) + " Y levels and " +
                std::to_string(xLevels.size()) + " X levels.");
        }
        requireDistinct(xLevels, "X");
        requireDistinct(yLevels, "Y");
        validate();
    }

    Eigen::VectorXd JointObservationTable::defaultXLevels() {
        Eigen::VectorXd levels(4);
        levels << 2.0, 3.0, 4.0, 5.0;
        return levels;
    }

    Eigen::VectorXd JointObservationTable::defaultYLevels() {
        Eigen::VectorXd levels(3);
        levels << 6.0, 7.0, 8.0;
        return levels;
    }

    void JointObservationTable::validate() const {
        const std::string F_NAME = "JointObservationTable::validate";
        if (counts.size() == 0) {
            THROW_INVALID_PARAM(F_NAME, "table must have at least one cell.");
        }
        long sum = 0;
        for (Eigen::Index r = 0; r < counts.rows(); ++r) {
            for (Eigen::Index c = 0; c < counts.cols(); ++c) {
                if (counts(r, c) < 0) {
                    THROW_INVALID_PARAM(F_NAME, "count at (" + std::to_string(r) + ", " + std::to_string(c) +
                                        ") is " + std::to_string(counts(r, c)) + ", expected >= 0.");
                }
                sum += counts(r, c);
            }
        }
        if (sum != totalTrials) {
            THROW_INVALID_PARAM(F_NAME, "table counts sum to " + std::to_string(sum) +
                                " but N is " + std::to_string(totalTrials) + ".");
        }
        if (totalTrials <= 0) {
            THROW_INVALID_PARAM(F_NAME, "table must record at least one trial.");
        }
    }

    double JointObservationTable::jointProbability(Eigen::Index row, Eigen::Index col) const {
        if (row < 0 || row >= counts.rows() || col < 0 || col >= counts.cols()) {
            THROW_INVALID_PARAM("JointObservationTable::jointProbability", "cell index out of range.");
        }
        return static_cast<double>(counts(row, col)) / static_cast<double>(totalTrials);
    }

    Eigen::Index JointObservationTable::rowOfY(double y) const {
        return findLevel(yLevels, y, "Y");
    }

    Eigen::Index JointObservationTable::colOfX(double x) const {
        return findLevel(xLevels, x, "X");
    }

    JointTableSummary JointObservationTable::summarize() const {
        JointTableSummary summary;
        const double n = static_cast<double>(totalTrials);
        summary.total = totalTrials;
        summary.rowMarginals = counts.rowwise().sum();
        summary.colMarginals = counts.colwise().sum().transpose();
        summary.rowProbabilities = summary.rowMarginals.cast<double>() / n;
        summary.colProbabilities = summary.colMarginals.cast<double>() / n;
        summary.jointProbabilities = counts.cast<double>() / n;
        return summary;
    }

} // namespace cyberrisk
