#include "core/RiskAnalysisService.hpp"
#include "controls/solvers/SimplexSolver.hpp"
#include "probability/CellDetectionModel.hpp"
#include "utils/FileUtils.hpp"
#include "utils/ReadRiskConfiguration.hpp"
#include "exceptions/Exceptions.hpp"
#include <gtest/gtest.h>
#include <memory>
#include <thread>
#include <vector>

using namespace cyberrisk;

// Runs against the configuration shipped under data/
class RiskAnalysisServiceTest : public ::testing::Test {
protected:
    ScenarioParameters scenario;

    void SetUp() override {
        scenario = readScenarioParameters(FileUtils::getDataPath("scenario.txt"));
        scenario.iterations = 20000;
    }
};

TEST_F(RiskAnalysisServiceTest, SimulationFromShippedScenario) {
    const SimulationResult result = RiskAnalysisService::runSimulation(scenario);
    EXPECT_EQ(result.iterations, 20000u);
    EXPECT_GT(result.annualLossExpectancy, 0.0);
    EXPECT_NEAR(result.expectedOccurrences, 1.15, 1e-12);
}

TEST_F(RiskAnalysisServiceTest, ShippedScenarioReproducesItsBaseline) {
    scenario.iterations = 50000;
    const SimulationResult result = RiskAnalysisService::runSimulation(scenario);
    EXPECT_EQ(result.seed, 42u);
    EXPECT_DOUBLE_EQ(result.annualLossExpectancy, 6631882423.904167);
    EXPECT_DOUBLE_EQ(result.probLossAtLeast, 0.08166);
    EXPECT_DOUBLE_EQ(result.probLossWithin, 0.42634);
}

TEST_F(RiskAnalysisServiceTest, ConditionalProbabilitiesFromShippedTable) {
    const JointTableConfig config = readJointObservationTable(FileUtils::getDataPath("joint_table.txt"));
    const ConditionalProbabilityResult result =
        RiskAnalysisService::evaluateConditionalProbabilities(config.table, config.detectionRates, config.query);
    EXPECT_NEAR(result.pMarginal, 90.0 / 290.0, 1e-12);
    EXPECT_NEAR(result.pRange, 165.0 / 290.0, 1e-12);
    EXPECT_NEAR(result.pXRange, 175.0 / 290.0, 1e-12);
    EXPECT_NEAR(result.pConditional, 68.0 / 212.75, 1e-12);
}

TEST_F(RiskAnalysisServiceTest, ConditionalProbabilitiesWithCellModel) {
    const JointTableConfig config = readJointObservationTable(FileUtils::getDataPath("joint_table.txt"));
    const CellDetectionModel model(Eigen::MatrixXd::Constant(3, 4, 0.9));
    const ConditionalProbabilityResult result =
        RiskAnalysisService::evaluateConditionalProbabilities(config.table, model);
    EXPECT_NEAR(result.pDetection, 0.9, 1e-12);
    EXPECT_NEAR(result.pConditional, 90.0 / 290.0, 1e-12);
}

TEST_F(RiskAnalysisServiceTest, ControlOptimizationFromShippedFiles) {
    const ControlDeploymentMatrix history = readControlHistory(FileUtils::getDataPath("control_history.txt"));
    const OptimizationConfig config = readOptimizationSpec(FileUtils::getDataPath("optimization.txt"));

    auto solver = std::make_shared<SimplexSolver>();
    solver->configure(readSolverSettings(FileUtils::getDataPath("solver.txt")));

    const OptimizationResult result =
        RiskAnalysisService::optimizeControls(history, config.spec, config.fitIntercept, solver);
    ASSERT_TRUE(result.isOptimal()) << result.message;
    EXPECT_NEAR(result.totalAdditionalCost, 40000.0 / 31.0, 1e-6);
}

TEST_F(RiskAnalysisServiceTest, ConcurrentEngineCallsAreIndependent) {
    scenario.iterations = 5000;
    const SimulationResult reference = RiskAnalysisService::runSimulation(scenario);

    const JointTableConfig joint = readJointObservationTable(FileUtils::getDataPath("joint_table.txt"));
    const ControlDeploymentMatrix history = readControlHistory(FileUtils::getDataPath("control_history.txt"));
    const OptimizationConfig optimization = readOptimizationSpec(FileUtils::getDataPath("optimization.txt"));

    const int workers = 4;
    std::vector<SimulationResult> simulations(workers);
    std::vector<double> posteriors(workers, 0.0);
    std::vector<double> costs(workers, 0.0);
    std::vector<std::thread> threads;
    for (int i = 0; i < workers; ++i) {
        threads.emplace_back([&, i]() {
            simulations[static_cast<std::size_t>(i)] = RiskAnalysisService::runSimulation(scenario);
            posteriors[static_cast<std::size_t>(i)] = RiskAnalysisService::evaluateConditionalProbabilities(
                joint.table, joint.detectionRates, joint.query).pConditional;
            costs[static_cast<std::size_t>(i)] =
                RiskAnalysisService::optimizeControls(history, optimization.spec).totalAdditionalCost;
        });
    }
    for (std::thread& t : threads) {
        t.join();
    }

    for (int i = 0; i < workers; ++i) {
        const auto idx = static_cast<std::size_t>(i);
        EXPECT_EQ(simulations[idx].annualLossExpectancy, reference.annualLossExpectancy);
        EXPECT_EQ(simulations[idx].probLossWithin, reference.probLossWithin);
        EXPECT_NEAR(posteriors[idx], 68.0 / 212.75, 1e-12);
        EXPECT_NEAR(costs[idx], 40000.0 / 31.0, 1e-6);
    }
}

TEST_F(RiskAnalysisServiceTest, CancellationFromAnotherThreadStopsTheRun) {
    CancellationToken token;
    std::thread canceller([&token]() { token.cancel(); });
    canceller.join();
    EXPECT_THROW(RiskAnalysisService::runSimulation(scenario, &token), SimulationCancelledException);
}

TEST_F(RiskAnalysisServiceTest, InvalidInputsPropagate) {
    scenario.paretoShape = 0.0;
    EXPECT_THROW(RiskAnalysisService::runSimulation(scenario), InvalidParameterException);

    const JointTableConfig config = readJointObservationTable(FileUtils::getDataPath("joint_table.txt"));
    const std::vector<double> inconsistent = {0.8, 0.75, 0.7, 0.65, 0.6, 0.55};
    EXPECT_THROW(RiskAnalysisService::evaluateConditionalProbabilities(config.table, inconsistent),
                 InvalidParameterException);
}
