#include <iostream>
#include <iomanip>
#include <memory>
#include <string>
#include <sstream>
#include <Eigen/Dense>

#include "core/RiskAnalysisService.hpp"
#include "controls/ControlPortfolioAnalysis.hpp"
#include "controls/solvers/SimplexSolver.hpp"
#include "utils/FileUtils.hpp"
#include "utils/ReadRiskConfiguration.hpp"
#include "exceptions/Exceptions.hpp"
#include "exceptions/ConfigReadException.hpp"
#include "utils/Logger.hpp"

using namespace std;
using namespace cyberrisk;

namespace {

    string formatPercentiles(const PercentileBreakdown& p) {
        ostringstream oss;
        oss << fixed << setprecision(2)
            << "P50=" << p.p50 << " P75=" << p.p75 << " P90=" << p.p90
            << " P95=" << p.p95 << " P99=" << p.p99;
        return oss.str();
    }

} // namespace

int main() {
    Logger::getInstance().setLogLevel(LogLevel::INFO);
    Logger::getInstance().info("main", "Starting cyber-risk analysis demo...");

    try {
        // --- Loss expectancy ---
        const string scenario_path = FileUtils::getDataPath("scenario.txt");
        Logger::getInstance().info("main", "Loading scenario from: " + scenario_path);
        const ScenarioParameters scenario = readScenarioParameters(scenario_path);

        const SimulationResult sim = RiskAnalysisService::runSimulation(scenario);
        {
            ostringstream oss;
            oss << fixed << setprecision(2)
                << "ALE=" << sim.annualLossExpectancy
                << ", asset value mean=" << sim.assetValueMean << " (analytic " << sim.analyticAssetValueMean << ")"
                << ", median=" << sim.assetValueMedian << " (analytic " << sim.analyticAssetValueMedian << ")";
            Logger::getInstance().info("main", oss.str());
        }
        {
            ostringstream oss;
            oss << setprecision(4)
                << "P(asset <= " << scenario.assetValueThreshold << ")=" << sim.probAssetValueAtMost
                << ", P(loss >= " << scenario.lossExceedanceThreshold << ")=" << sim.probLossAtLeast
                << ", P(" << scenario.lossRangeLower << " <= loss <= " << scenario.lossRangeUpper << ")="
                << sim.probLossWithin
                << ", expected occurrences=" << sim.expectedOccurrences;
            Logger::getInstance().info("main", oss.str());
        }
        if (sim.assetValuePercentiles) {
            Logger::getInstance().info("main", "Asset value percentiles: " + formatPercentiles(*sim.assetValuePercentiles));
        }
        if (sim.annualLossPercentiles) {
            Logger::getInstance().info("main", "Annual loss percentiles: " + formatPercentiles(*sim.annualLossPercentiles));
        }

        // --- Conditional probabilities ---
        const string table_path = FileUtils::getDataPath("joint_table.txt");
        Logger::getInstance().info("main", "Loading joint table from: " + table_path);
        const JointTableConfig tableConfig = readJointObservationTable(table_path);

        const ConditionalProbabilityResult probs = RiskAnalysisService::evaluateConditionalProbabilities(
            tableConfig.table, tableConfig.detectionRates, tableConfig.query);
        {
            ostringstream oss;
            oss << fixed << setprecision(4)
                << "P(" << tableConfig.query.xRangeLower << " <= X <= " << tableConfig.query.xRangeUpper << ")="
                << probs.pXRange
                << ", P(T)=" << probs.pDetection;
            Logger::getInstance().info("main", oss.str());
        }

        // --- Control optimization ---
        const ControlDeploymentMatrix history = readControlHistory(FileUtils::getDataPath("control_history.txt"));
        const OptimizationConfig optConfig = readOptimizationSpec(FileUtils::getDataPath("optimization.txt"));

        auto solver = std::make_shared<SimplexSolver>();
        solver->configure(readSolverSettings(FileUtils::getDataPath("solver.txt")));

        const OptimizationResult opt = RiskAnalysisService::optimizeControls(history, optConfig.spec,
                                                                             optConfig.fitIntercept, solver);
        Logger::getInstance().info("main", "Optimizer status: " + toString(opt.status) + " (" + opt.message + ")");

        if (opt.isOptimal()) {
            ostringstream oss;
            oss << fixed << setprecision(2)
                << "Total additional cost=" << opt.totalAdditionalCost
                << ", projected safeguard effect=" << opt.projectedSafeguardEffect
                << ", projected maintenance load=" << opt.projectedMaintenanceLoad;
            Logger::getInstance().info("main", oss.str());
            if (opt.hasFractionalUnits()) {
                Logger::getInstance().warning("main", "Recommended additions are fractional; round up before purchasing.");
            }

            const auto recommendations = ControlPortfolioAnalysis::generateRecommendations(
                optConfig.spec.currentDeployment, opt.additionalUnits, history.controlNames);
            for (const auto& rec : recommendations) {
                ostringstream line;
                line << fixed << setprecision(2) << rec.controlName << ": " << rec.currentCount
                     << " -> " << rec.newTotal << " (+" << rec.recommendedAdditional << ", "
                     << toString(rec.priority) << " priority)";
                Logger::getInstance().info("main", line.str());
            }

            // Savings assume the recommended controls cut the scenario's ALE by 10%
            const ReturnOnInvestment roi = ControlPortfolioAnalysis::calculateReturnOnInvestment(
                opt.additionalUnits, optConfig.spec.unitCosts, 10.0, sim.annualLossExpectancy);
            ostringstream roiLine;
            roiLine << fixed << setprecision(2) << "ROI=" << roi.roiPercentage << "%, payback="
                    << roi.paybackYears << " years, 3y NPV=" << roi.netPresentValue3y;
            Logger::getInstance().info("main", roiLine.str());
        }

        Logger::getInstance().info("main", "Analysis completed successfully.");
        return 0;
    }
    catch (const ConfigReadException& e) {
        Logger::getInstance().fatal("main", "Configuration Error: " + std::string(e.what()));
        cerr << "Critical Error: Failed to read configuration. " << e.what() << endl;
        return 1;
    }
    catch (const DataFormatException& e) {
        Logger::getInstance().fatal("main", "Data Format Error: " + std::string(e.what()));
        cerr << "Critical Error: Invalid data format encountered. " << e.what() << endl;
        return 1;
    }
    catch (const InvalidParameterException& e) {
        Logger::getInstance().fatal("main", "Invalid Parameter Error: " + std::string(e.what()));
        cerr << "Critical Error: Invalid parameter provided. " << e.what() << endl;
        return 1;
    }
    catch (const DomainErrorException& e) {
        Logger::getInstance().fatal("main", "Domain Error: " + std::string(e.what()));
        cerr << "Critical Error: A query has no defined answer. " << e.what() << endl;
        return 1;
    }
    catch (const RiskModelException& e) {
        Logger::getInstance().fatal("main", "General Error: " + std::string(e.what()));
        cerr << "Critical Error: An unspecified analysis error occurred. " << e.what() << endl;
        return 1;
    }
    catch (const std::exception& e) {
        Logger::getInstance().fatal("main", "Unexpected Error: " + std::string(e.what()));
        cerr << "Critical Error: " << e.what() << endl;
        return 1;
    }
}
