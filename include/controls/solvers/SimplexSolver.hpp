#ifndef SIMPLEX_SOLVER_HPP
#define SIMPLEX_SOLVER_HPP

#include "controls/interfaces/ILinearProgramSolver.hpp"
#include "core/RiskConstants.hpp"
#include <map>
#include <string>

namespace cyberrisk {

/**
 * @brief Dense two-phase tableau simplex with Bland's anti-cycling rule.
 *
 * Rows with a negative right-hand side are negated first. Finite upper bounds become
 * extra <= rows. Phase 1 minimizes the sum of artificial variables; any artificial left
 * in the basis at zero is pivoted out where possible before phase 2, which never lets
 * an artificial column re-enter.
 *
 * Degenerate programs may have several optimal vertices; which one is returned depends
 * on the pivoting order only.
 */
class SimplexSolver : public ILinearProgramSolver {
public:
    SimplexSolver() = default;

    /**
     * @brief Configure solver settings.
     *
     * @param settings Supported keys: "max_iterations" (pivot limit across both phases)
     *                 and "tolerance" (pivot and feasibility tolerance).
     */
    void configure(const std::map<std::string, double>& settings) override;

    LinearProgramSolution solve(const LinearProgram& program) const override;

    int getMaxIterations() const { return max_iterations_; }
    double getTolerance() const { return tolerance_; }

private:
    int max_iterations_ = constants::DEFAULT_SIMPLEX_MAX_ITERATIONS;   ///< Pivot limit across both phases
    double tolerance_ = constants::DEFAULT_SIMPLEX_TOLERANCE;          ///< Pivot and feasibility tolerance
};

} // namespace cyberrisk

#endif // SIMPLEX_SOLVER_HPP
