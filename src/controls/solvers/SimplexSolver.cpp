#include "controls/solvers/SimplexSolver.hpp"
#include "utils/Logger.hpp"
#include <algorithm>
#include <cmath>
#include <vector>

namespace cyberrisk {

namespace {

    struct Row {
        Eigen::VectorXd coefficients;
        ConstraintSense sense;
        double rhs;
    };

    /**
     * Tableau with constraint rows 0..m-1 and the reduced-cost row m.
     * The last column holds right-hand sides; in row m it holds minus the objective.
     */
    struct Tableau {
        Eigen::MatrixXd T;
        std::vector<Eigen::Index> basis;
        Eigen::Index firstArtificial = 0;

        Eigen::Index rows() const { return T.rows() - 1; }
        Eigen::Index rhsCol() const { return T.cols() - 1; }

        void pivot(Eigen::Index r, Eigen::Index c) {
            const double pivotValue = T(r, c);
            T.row(r) /= pivotValue;
            for (Eigen::Index i = 0; i < T.rows(); ++i) {
                if (i == r) continue;
                const double factor = T(i, c);
                if (factor != 0.0) {
                    T.row(i) -= factor * T.row(r);
                }
            }
            basis[static_cast<std::size_t>(r)] = c;
        }
    };

    enum class PhaseOutcome { Optimal, Unbounded, IterationLimit };

    // Minimizes the reduced-cost row over columns [0, columnLimit) using Bland's rule.
    PhaseOutcome iterate(Tableau& tab, Eigen::Index columnLimit, double tol, int maxIterations, int& iterations) {
        const Eigen::Index m = tab.rows();
        const Eigen::Index rhs = tab.rhsCol();
        while (true) {
            Eigen::Index entering = -1;
            for (Eigen::Index j = 0; j < columnLimit; ++j) {
                if (tab.T(m, j) < -tol) {
                    entering = j;
                    break;
                }
            }
            if (entering < 0) {
                return PhaseOutcome::Optimal;
            }

            Eigen::Index leaving = -1;
            double bestRatio = 0.0;
            for (Eigen::Index i = 0; i < m; ++i) {
                const double a = tab.T(i, entering);
                if (a <= tol) continue;
                const double ratio = tab.T(i, rhs) / a;
                if (leaving < 0 || ratio < bestRatio - tol ||
                    (std::abs(ratio - bestRatio) <= tol &&
                     tab.basis[static_cast<std::size_t>(i)] < tab.basis[static_cast<std::size_t>(leaving)])) {
                    leaving = i;
                    bestRatio = ratio;
                }
            }
            if (leaving < 0) {
                return PhaseOutcome::Unbounded;
            }
            if (iterations >= maxIterations) {
                return PhaseOutcome::IterationLimit;
            }
            tab.pivot(leaving, entering);
            ++iterations;
        }
    }

    std::vector<Row> normalizedRows(const LinearProgram& program) {
        std::vector<Row> rows;
        const Eigen::Index n = program.numVariables();
        for (Eigen::Index i = 0; i < program.numConstraints(); ++i) {
            rows.push_back({program.constraintMatrix.row(i).transpose(),
                            program.senses[static_cast<std::size_t>(i)], program.rhs(i)});
        }
        for (Eigen::Index j = 0; j < program.upperBounds.size(); ++j) {
            if (std::isfinite(program.upperBounds(j))) {
                Eigen::VectorXd unit = Eigen::VectorXd::Zero(n);
                unit(j) = 1.0;
                rows.push_back({unit, ConstraintSense::LessEqual, program.upperBounds(j)});
            }
        }
        for (Row& row : rows) {
            if (row.rhs < 0.0) {
                row.coefficients = -row.coefficients;
                row.rhs = -row.rhs;
                if (row.sense == ConstraintSense::LessEqual) {
                    row.sense = ConstraintSense::GreaterEqual;
                } else if (row.sense == ConstraintSense::GreaterEqual) {
                    row.sense = ConstraintSense::LessEqual;
                }
            }
        }
        return rows;
    }

    Tableau buildTableau(const std::vector<Row>& rows, Eigen::Index n) {
        Eigen::Index slackCount = 0;
        Eigen::Index artificialCount = 0;
        for (const Row& row : rows) {
            if (row.sense != ConstraintSense::Equal) ++slackCount;
            if (row.sense != ConstraintSense::LessEqual) ++artificialCount;
        }
        const Eigen::Index m = static_cast<Eigen::Index>(rows.size());
        const Eigen::Index columns = n + slackCount + artificialCount;

        Tableau tab;
        tab.T = Eigen::MatrixXd::Zero(m + 1, columns + 1);
        tab.basis.assign(rows.size(), 0);
        tab.firstArtificial = n + slackCount;

        Eigen::Index nextSlack = n;
        Eigen::Index nextArtificial = tab.firstArtificial;
        for (Eigen::Index i = 0; i < m; ++i) {
            const Row& row = rows[static_cast<std::size_t>(i)];
            tab.T.block(i, 0, 1, n) = row.coefficients.transpose();
            tab.T(i, columns) = row.rhs;
            switch (row.sense) {
                case ConstraintSense::LessEqual:
                    tab.T(i, nextSlack) = 1.0;
                    tab.basis[static_cast<std::size_t>(i)] = nextSlack++;
                    break;
                case ConstraintSense::GreaterEqual:
                    tab.T(i, nextSlack++) = -1.0;
                    tab.T(i, nextArtificial) = 1.0;
                    tab.basis[static_cast<std::size_t>(i)] = nextArtificial++;
                    break;
                case ConstraintSense::Equal:
                    tab.T(i, nextArtificial) = 1.0;
                    tab.basis[static_cast<std::size_t>(i)] = nextArtificial++;
                    break;
            }
        }
        return tab;
    }

    // Loads the reduced-cost row for the cost vector, priced out against the current basis.
    void priceOut(Tableau& tab, const Eigen::VectorXd& costs) {
        const Eigen::Index m = tab.rows();
        tab.T.row(m).setZero();
        tab.T.block(m, 0, 1, costs.size()) = costs.transpose();
        for (Eigen::Index i = 0; i < m; ++i) {
            const Eigen::Index b = tab.basis[static_cast<std::size_t>(i)];
            const double cb = b < costs.size() ? costs(b) : 0.0;
            if (cb != 0.0) {
                tab.T.row(m) -= cb * tab.T.row(i);
            }
        }
    }

    LinearProgramSolution stopped(SolverStatus status, int iterations, const std::string& message) {
        LinearProgramSolution solution;
        solution.status = status;
        solution.iterations = iterations;
        solution.message = message;
        return solution;
    }

} // namespace

void SimplexSolver::configure(const std::map<std::string, double>& settings) {
    auto get = [&](const std::string& key, double def) {
        auto it = settings.find(key);
        return it != settings.end() ? it->second : def;
    };

    max_iterations_ = static_cast<int>(get("max_iterations", max_iterations_));
    tolerance_      = get("tolerance", tolerance_);

    max_iterations_ = std::max(max_iterations_, 1);
    tolerance_      = std::clamp(tolerance_, 1e-15, 1e-3);

    Logger::getInstance().info("SimplexSolver",
        "Configured with max_iterations=" + std::to_string(max_iterations_) +
        ", tolerance=" + std::to_string(tolerance_));
}

LinearProgramSolution SimplexSolver::solve(const LinearProgram& program) const {
    const std::string F_NAME = "SimplexSolver::solve";
    program.validate();

    const Eigen::Index n = program.numVariables();
    const std::vector<Row> rows = normalizedRows(program);
    Tableau tab = buildTableau(rows, n);
    const Eigen::Index columns = tab.rhsCol();
    const Eigen::Index m = tab.rows();
    int iterations = 0;

    double rhsScale = 1.0;
    for (const Row& row : rows) {
        rhsScale = std::max(rhsScale, std::abs(row.rhs));
    }

    if (tab.firstArtificial < columns) {
        Eigen::VectorXd phaseOneCosts = Eigen::VectorXd::Zero(columns);
        phaseOneCosts.tail(columns - tab.firstArtificial).setOnes();
        priceOut(tab, phaseOneCosts);

        const PhaseOutcome outcome = iterate(tab, columns, tolerance_, max_iterations_, iterations);
        if (outcome == PhaseOutcome::IterationLimit) {
            return stopped(SolverStatus::IterationLimit, iterations,
                           "Iteration limit reached while searching for a feasible point.");
        }
        const double infeasibility = -tab.T(m, columns);
        if (infeasibility > tolerance_ * rhsScale * 10.0) {
            Logger::getInstance().debug(F_NAME, "Phase 1 ended with infeasibility " + std::to_string(infeasibility));
            return stopped(SolverStatus::Infeasible, iterations, "No point satisfies all constraints.");
        }

        for (Eigen::Index i = 0; i < m; ++i) {
            if (tab.basis[static_cast<std::size_t>(i)] < tab.firstArtificial) continue;
            for (Eigen::Index j = 0; j < tab.firstArtificial; ++j) {
                if (std::abs(tab.T(i, j)) > tolerance_) {
                    tab.pivot(i, j);
                    break;
                }
            }
            // A row left with an artificial basis is redundant; it has zeros in every
            // column phase 2 may enter, so it never changes.
        }
    }

    Eigen::VectorXd costs = program.maximize ? Eigen::VectorXd(-program.objective) : program.objective;
    priceOut(tab, costs);
    const PhaseOutcome outcome = iterate(tab, tab.firstArtificial, tolerance_, max_iterations_, iterations);
    if (outcome == PhaseOutcome::IterationLimit) {
        return stopped(SolverStatus::IterationLimit, iterations, "Iteration limit reached before optimality.");
    }
    if (outcome == PhaseOutcome::Unbounded) {
        return stopped(SolverStatus::Unbounded, iterations, "Objective is unbounded over the feasible region.");
    }

    LinearProgramSolution solution;
    solution.status = SolverStatus::Optimal;
    solution.iterations = iterations;
    solution.x = Eigen::VectorXd::Zero(n);
    for (Eigen::Index i = 0; i < m; ++i) {
        const Eigen::Index b = tab.basis[static_cast<std::size_t>(i)];
        if (b < n) {
            solution.x(b) = std::max(0.0, tab.T(i, columns));
        }
    }
    solution.objectiveValue = program.objective.dot(solution.x);
    solution.message = "Optimal solution found after " + std::to_string(iterations) + " pivots.";
    Logger::getInstance().debug(F_NAME, solution.message);
    return solution;
}

} // namespace cyberrisk
