#include "controls/LinearProgram.hpp"
#include "exceptions/Exceptions.hpp"
#include <cmath>

namespace cyberrisk {

    std::string toString(SolverStatus status) {
        switch (status) {
            case SolverStatus::Optimal:        return "optimal";
            case SolverStatus::Infeasible:     return "infeasible";
            case SolverStatus::Unbounded:      return "unbounded";
            case SolverStatus::IterationLimit: return "iteration_limit";
        }
        return "unknown";
    }

    void LinearProgram::validate() const {
        const std::string F_NAME = "LinearProgram::validate";
        const Eigen::Index n = numVariables();
        const Eigen::Index m = numConstraints();
        if (n == 0) {
            THROW_INVALID_PARAM(F_NAME, "linear program has no variables.");
        }
        if (m > 0 && constraintMatrix.cols() != n) {
            THROW_INVALID_PARAM(F_NAME, "constraint matrix has " + std::to_string(constraintMatrix.cols()) +
                                " columns for " + std::to_string(n) + " variables.");
        }
        if (rhs.size() != m || static_cast<Eigen::Index>(senses.size()) != m) {
            THROW_INVALID_PARAM(F_NAME, "expected " + std::to_string(m) + " right-hand sides and senses, got " +
                                std::to_string(rhs.size()) + " and " + std::to_string(senses.size()) + ".");
        }
        if (upperBounds.size() != 0 && upperBounds.size() != n) {
            THROW_INVALID_PARAM(F_NAME, "expected " + std::to_string(n) + " upper bounds, got " +
                                std::to_string(upperBounds.size()) + ".");
        }
        if (!objective.allFinite() || !constraintMatrix.allFinite() || !rhs.allFinite()) {
            THROW_INVALID_PARAM(F_NAME, "objective, constraint and right-hand side values must be finite.");
        }
        for (Eigen::Index j = 0; j < upperBounds.size(); ++j) {
            if (std::isnan(upperBounds(j)) || upperBounds(j) < 0.0) {
                THROW_INVALID_PARAM(F_NAME, "upper bound of variable " + std::to_string(j) + " is " +
                                    std::to_string(upperBounds(j)) + ", expected a value >= 0.");
            }
        }
    }

} // namespace cyberrisk
