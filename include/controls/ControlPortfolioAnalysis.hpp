#ifndef CONTROL_PORTFOLIO_ANALYSIS_HPP
#define CONTROL_PORTFOLIO_ANALYSIS_HPP

#include "controls/ControlEffectivenessModel.hpp"
#include "controls/LinearProgram.hpp"
#include "controls/interfaces/ILinearProgramSolver.hpp"
#include <Eigen/Dense>
#include <string>
#include <vector>

namespace cyberrisk {

    struct PortfolioEvaluation {
        double safeguardEffect = 0.0;
        double maintenanceLoad = 0.0;
    };

    struct ReturnOnInvestment {
        double totalCost = 0.0;
        double annualSavings = 0.0;
        double roiPercentage = 0.0;      ///< 0 when the cost is 0.
        double paybackYears = 0.0;       ///< +infinity when there are no savings.
        double netPresentValue3y = 0.0;  ///< 3 * annualSavings - totalCost, undiscounted.
    };

    struct BudgetAllocation {
        SolverStatus status = SolverStatus::Infeasible;
        Eigen::VectorXd selection;       ///< Fraction of each control selected, in [0, 1].
        double totalCost = 0.0;
        double totalEffectiveness = 0.0;
        double budgetUtilization = 0.0;  ///< Percent of the budget spent.
    };

    enum class RecommendationPriority { Low, Medium, High };

    std::string toString(RecommendationPriority priority);

    struct ControlRecommendation {
        std::string controlName;
        double currentCount = 0.0;
        double recommendedAdditional = 0.0;  ///< Rounded to two decimals.
        double newTotal = 0.0;
        RecommendationPriority priority = RecommendationPriority::Low;
    };

    /**
     * @class ControlPortfolioAnalysis
     * @brief Evaluation and reporting helpers around the control optimizer.
     */
    class ControlPortfolioAnalysis {
    public:
        ControlPortfolioAnalysis() = delete;

        /**
         * @brief Safeguard effect and maintenance load of a deployment under a fitted model.
         * @throws InvalidParameterException if the deployment length does not match the fit.
         */
        static PortfolioEvaluation evaluatePortfolio(const ControlEffectivenessFit& fit,
                                                     const Eigen::VectorXd& deployment);

        /**
         * @brief Return on investment of adding controls.
         *
         * @param additionalUnits Units added per control type.
         * @param unitCosts Cost per unit.
         * @param riskReductionPercent Percent of the current ALE avoided per year.
         * @param currentAle Current annualized loss expectancy.
         * @throws InvalidParameterException on a length mismatch or non-finite input.
         */
        static ReturnOnInvestment calculateReturnOnInvestment(const Eigen::VectorXd& additionalUnits,
                                                              const Eigen::VectorXd& unitCosts,
                                                              double riskReductionPercent,
                                                              double currentAle);

        /**
         * @brief Maximize sum eff_i * s_i subject to sum cost_i * s_i <= budget, 0 <= s_i <= 1.
         *
         * The 0/1 selection is relaxed to fractions.
         * @throws InvalidParameterException if the budget is not positive, the vectors
         *         differ in length or a cost is negative.
         */
        static BudgetAllocation optimizeBudgetAllocation(double budget,
                                                         const Eigen::VectorXd& unitCosts,
                                                         const Eigen::VectorXd& effectiveness,
                                                         const ILinearProgramSolver& solver);

        /** @brief As above with a default SimplexSolver. */
        static BudgetAllocation optimizeBudgetAllocation(double budget,
                                                         const Eigen::VectorXd& unitCosts,
                                                         const Eigen::VectorXd& effectiveness);

        /**
         * @brief Readable recommendations for additions above 0.01 units, largest first.
         *
         * Priority is High above 2 units, Medium above 1, Low otherwise.
         * @param names Control names; "Control Type i" is used when empty.
         * @throws InvalidParameterException on a length mismatch.
         */
        static std::vector<ControlRecommendation> generateRecommendations(const Eigen::VectorXd& currentDeployment,
                                                                          const Eigen::VectorXd& additionalUnits,
                                                                          const std::vector<std::string>& names = {});
    };

} // namespace cyberrisk

#endif // CONTROL_PORTFOLIO_ANALYSIS_HPP
