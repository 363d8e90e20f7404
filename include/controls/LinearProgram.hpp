#ifndef LINEAR_PROGRAM_HPP
#define LINEAR_PROGRAM_HPP

#include <Eigen/Dense>
#include <limits>
#include <string>
#include <vector>

namespace cyberrisk {

    enum class ConstraintSense {
        LessEqual,
        GreaterEqual,
        Equal
    };

    /**
     * @brief Outcome of a linear program solve. Infeasible and Unbounded are expected
     *        outcomes reported in the solution, not errors.
     */
    enum class SolverStatus {
        Optimal,
        Infeasible,
        Unbounded,
        IterationLimit
    };

    std::string toString(SolverStatus status);

    /**
     * @brief optimize objective . x  subject to  A x (<=|>=|=) b,  0 <= x <= upperBounds.
     *
     * Upper bounds may be +infinity. An empty upperBounds vector means all are infinite.
     */
    struct LinearProgram {
        Eigen::VectorXd objective;
        Eigen::MatrixXd constraintMatrix;
        Eigen::VectorXd rhs;
        std::vector<ConstraintSense> senses;
        Eigen::VectorXd upperBounds;
        bool maximize = false;

        Eigen::Index numVariables() const { return objective.size(); }
        Eigen::Index numConstraints() const { return constraintMatrix.rows(); }

        /**
         * @brief Check dimensions and values.
         * @throws InvalidParameterException on mismatched sizes, non-finite coefficients or
         *         negative or NaN upper bounds.
         */
        void validate() const;
    };

    struct LinearProgramSolution {
        SolverStatus status = SolverStatus::Infeasible;
        Eigen::VectorXd x;              ///< Primal solution, meaningful only when Optimal.
        double objectiveValue = std::numeric_limits<double>::quiet_NaN();
        int iterations = 0;
        std::string message;

        bool isOptimal() const { return status == SolverStatus::Optimal; }
    };

} // namespace cyberrisk

#endif // LINEAR_PROGRAM_HPP
