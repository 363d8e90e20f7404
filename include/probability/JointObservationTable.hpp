#ifndef JOINT_OBSERVATION_TABLE_HPP
#define JOINT_OBSERVATION_TABLE_HPP

#include <Eigen/Dense>

namespace cyberrisk {

    /**
     * @brief Marginal and joint views of a JointObservationTable.
     */
    struct JointTableSummary {
        long total = 0;
        Eigen::VectorXi rowMarginals;          ///< Count per Y level.
        Eigen::VectorXi colMarginals;          ///< Count per X level.
        Eigen::VectorXd rowProbabilities;      ///< P(Y = y) per Y level.
        Eigen::VectorXd colProbabilities;      ///< P(X = x) per X level.
        Eigen::MatrixXd jointProbabilities;    ///< P(X = x, Y = y), rows Y, columns X.
    };

    /**
     * @class JointObservationTable
     * @brief Joint occurrence counts of two categorical variables over N trials.
     *
     * Rows correspond to levels of Y and columns to levels of X. The default layout is
     * 3 x 4 with Y in {6, 7, 8} and X in {2, 3, 4, 5}. Level values are what sum and
     * range queries compare against.
     */
    class JointObservationTable {
    public:
        /**
         * @brief Construct a 3 x 4 table with the default levels.
         * @param counts Non-negative joint counts, rows Y, columns X.
         * @param totalTrials N; must equal the sum of counts.
         * @throws InvalidParameterException if the table is not 3 x 4, holds a negative
         *         count, or N is zero or inconsistent with the counts.
         */
        JointObservationTable(const Eigen::MatrixXi& counts, long totalTrials);

        /**
         * @brief Construct a table of any shape with explicit level values.
         * @throws InvalidParameterException as above, or if the level vectors do not
         *         match the table shape or repeat a level.
         */
        JointObservationTable(const Eigen::MatrixXi& counts, long totalTrials,
                              const Eigen::VectorXd& xLevels, const Eigen::VectorXd& yLevels);

        static Eigen::VectorXd defaultXLevels();
        static Eigen::VectorXd defaultYLevels();

        const Eigen::MatrixXi& getCounts() const { return counts; }
        long getTotalTrials() const { return totalTrials; }
        const Eigen::VectorXd& getXLevels() const { return xLevels; }
        const Eigen::VectorXd& getYLevels() const { return yLevels; }
        Eigen::Index rows() const { return counts.rows(); }
        Eigen::Index cols() const { return counts.cols(); }

        /** @brief P(X = xLevels[col], Y = yLevels[row]) = count / N. */
        double jointProbability(Eigen::Index row, Eigen::Index col) const;

        /**
         * @brief Row holding the given Y level.
         * @throws InvalidParameterException if y is not a level of the table.
         */
        Eigen::Index rowOfY(double y) const;

        /**
         * @brief Column holding the given X level.
         * @throws InvalidParameterException if x is not a level of the table.
         */
        Eigen::Index colOfX(double x) const;

        JointTableSummary summarize() const;

    private:
        void validate() const;

        Eigen::MatrixXi counts;
        long totalTrials;
        Eigen::VectorXd xLevels;
        Eigen::VectorXd yLevels;
    };

} // namespace cyberrisk

#endif // JOINT_OBSERVATION_TABLE_HPP
