#ifndef I_LINEAR_PROGRAM_SOLVER_HPP
#define I_LINEAR_PROGRAM_SOLVER_HPP

#include "controls/LinearProgram.hpp"
#include <map>
#include <string>

namespace cyberrisk {

/**
 * @brief Interface for linear program solvers used by the control optimizer.
 */
class ILinearProgramSolver {
public:
    virtual ~ILinearProgramSolver() = default;

    /**
     * @brief Solve the program.
     *
     * @param program A program that passes LinearProgram::validate().
     * @return LinearProgramSolution Status, primal point and objective value.
     * @throws InvalidParameterException if the program is malformed.
     */
    virtual LinearProgramSolution solve(const LinearProgram& program) const = 0;

    /**
     * @brief Configure solver-specific settings.
     * @param settings Map of setting names to values (e.g., "max_iterations", "tolerance").
     */
    virtual void configure(const std::map<std::string, double>& settings) = 0;
};

} // namespace cyberrisk

#endif // I_LINEAR_PROGRAM_SOLVER_HPP
