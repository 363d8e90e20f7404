#include "controls/ControlPortfolioAnalysis.hpp"
#include "controls/solvers/SimplexSolver.hpp"
#include "core/RiskConstants.hpp"
#include "exceptions/Exceptions.hpp"
#include "utils/Logger.hpp"
#include <algorithm>
#include <cmath>
#include <limits>

namespace cyberrisk {

    std::string toString(RecommendationPriority priority) {
        switch (priority) {
            case RecommendationPriority::High:   return "High";
            case RecommendationPriority::Medium: return "Medium";
            case RecommendationPriority::Low:    return "Low";
        }
        return "Low";
    }

    PortfolioEvaluation ControlPortfolioAnalysis::evaluatePortfolio(const ControlEffectivenessFit& fit,
                                                                    const Eigen::VectorXd& deployment) {
        PortfolioEvaluation evaluation;
        evaluation.safeguardEffect = fit.predictEffect(deployment);
        evaluation.maintenanceLoad = fit.predictLoad(deployment);
        return evaluation;
    }

    ReturnOnInvestment ControlPortfolioAnalysis::calculateReturnOnInvestment(const Eigen::VectorXd& additionalUnits,
                                                                             const Eigen::VectorXd& unitCosts,
                                                                             double riskReductionPercent,
                                                                             double currentAle) {
        const std::string F_NAME = "ControlPortfolioAnalysis::calculateReturnOnInvestment";
        if (additionalUnits.size() != unitCosts.size()) {
            THROW_INVALID_PARAM(F_NAME, "got " + std::to_string(additionalUnits.size()) + " additions and " +
                                std::to_string(unitCosts.size()) + " unit costs.");
        }
        if (!additionalUnits.allFinite() || !unitCosts.allFinite() ||
            !std::isfinite(riskReductionPercent) || !std::isfinite(currentAle)) {
            THROW_INVALID_PARAM(F_NAME, "inputs must be finite.");
        }

        ReturnOnInvestment roi;
        roi.totalCost = additionalUnits.dot(unitCosts);
        roi.annualSavings = currentAle * (riskReductionPercent / 100.0);
        roi.roiPercentage = roi.totalCost > 0.0
            ? (roi.annualSavings - roi.totalCost) / roi.totalCost * 100.0
            : 0.0;
        roi.paybackYears = roi.annualSavings > 0.0
            ? roi.totalCost / roi.annualSavings
            : std::numeric_limits<double>::infinity();
        roi.netPresentValue3y = constants::ROI_HORIZON_YEARS * roi.annualSavings - roi.totalCost;
        return roi;
    }

    BudgetAllocation ControlPortfolioAnalysis::optimizeBudgetAllocation(double budget,
                                                                        const Eigen::VectorXd& unitCosts,
                                                                        const Eigen::VectorXd& effectiveness,
                                                                        const ILinearProgramSolver& solver) {
        const std::string F_NAME = "ControlPortfolioAnalysis::optimizeBudgetAllocation";
        if (!std::isfinite(budget) || budget <= 0.0) {
            THROW_INVALID_PARAM(F_NAME, "budget must be positive and finite, got " + std::to_string(budget) + ".");
        }
        if (unitCosts.size() == 0 || unitCosts.size() != effectiveness.size()) {
            THROW_INVALID_PARAM(F_NAME, "got " + std::to_string(unitCosts.size()) + " costs and " +
                                std::to_string(effectiveness.size()) + " effectiveness scores.");
        }
        if ((unitCosts.array() < 0.0).any()) {
            THROW_INVALID_PARAM(F_NAME, "control costs must be >= 0.");
        }

        LinearProgram program;
        program.maximize = true;
        program.objective = effectiveness;
        program.constraintMatrix = unitCosts.transpose();
        program.rhs = Eigen::VectorXd::Constant(1, budget);
        program.senses = {ConstraintSense::LessEqual};
        program.upperBounds = Eigen::VectorXd::Ones(unitCosts.size());

        const LinearProgramSolution solution = solver.solve(program);

        BudgetAllocation allocation;
        allocation.status = solution.status;
        if (!solution.isOptimal()) {
            Logger::getInstance().warning(F_NAME, "Budget allocation failed: " + solution.message);
            return allocation;
        }
        allocation.selection = solution.x;
        allocation.totalCost = solution.x.dot(unitCosts);
        allocation.totalEffectiveness = solution.x.dot(effectiveness);
        allocation.budgetUtilization = allocation.totalCost / budget * 100.0;
        return allocation;
    }

    BudgetAllocation ControlPortfolioAnalysis::optimizeBudgetAllocation(double budget,
                                                                        const Eigen::VectorXd& unitCosts,
                                                                        const Eigen::VectorXd& effectiveness) {
        SimplexSolver solver;
        return optimizeBudgetAllocation(budget, unitCosts, effectiveness, solver);
    }

    std::vector<ControlRecommendation> ControlPortfolioAnalysis::generateRecommendations(
        const Eigen::VectorXd& currentDeployment,
        const Eigen::VectorXd& additionalUnits,
        const std::vector<std::string>& names) {
        const std::string F_NAME = "ControlPortfolioAnalysis::generateRecommendations";
        if (currentDeployment.size() != additionalUnits.size()) {
            THROW_INVALID_PARAM(F_NAME, "got " + std::to_string(currentDeployment.size()) +
                                " current counts and " + std::to_string(additionalUnits.size()) + " additions.");
        }
        if (!names.empty() && static_cast<Eigen::Index>(names.size()) != currentDeployment.size()) {
            THROW_INVALID_PARAM(F_NAME, "got " + std::to_string(names.size()) + " names for " +
                                std::to_string(currentDeployment.size()) + " control types.");
        }

        std::vector<ControlRecommendation> recommendations;
        for (Eigen::Index i = 0; i < additionalUnits.size(); ++i) {
            const double additional = additionalUnits(i);
            if (additional <= constants::RECOMMENDATION_MIN_UNITS) continue;

            ControlRecommendation rec;
            rec.controlName = names.empty() ? "Control Type " + std::to_string(i + 1)
                                            : names[static_cast<std::size_t>(i)];
            rec.currentCount = currentDeployment(i);
            rec.recommendedAdditional = std::round(additional * 100.0) / 100.0;
            rec.newTotal = rec.currentCount + rec.recommendedAdditional;
            if (additional > constants::HIGH_PRIORITY_UNITS) {
                rec.priority = RecommendationPriority::High;
            } else if (additional > constants::MEDIUM_PRIORITY_UNITS) {
                rec.priority = RecommendationPriority::Medium;
            } else {
                rec.priority = RecommendationPriority::Low;
            }
            recommendations.push_back(rec);
        }

        std::stable_sort(recommendations.begin(), recommendations.end(),
                         [](const ControlRecommendation& a, const ControlRecommendation& b) {
                             return a.recommendedAdditional > b.recommendedAdditional;
                         });
        return recommendations;
    }

} // namespace cyberrisk
