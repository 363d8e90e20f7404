#ifndef READ_RISK_CONFIGURATION_HPP
#define READ_RISK_CONFIGURATION_HPP

#include <map>
#include <string>
#include <vector>
#include "simulation/ScenarioParameters.hpp"
#include "controls/ControlDeploymentMatrix.hpp"
#include "controls/OptimizationSpec.hpp"
#include "probability/JointObservationTable.hpp"
#include "probability/ConditionalProbabilityEvaluator.hpp"

/*
 * All readers take plain-text files of "key value [value ...]" lines. Blank lines and
 * anything after '#' are ignored. Unknown keys are logged as warnings and skipped.
 */

namespace cyberrisk {

    struct OptimizationConfig {
        OptimizationSpec spec;
        bool fitIntercept = false;
    };

    struct JointTableConfig {
        JointObservationTable table;
        std::vector<double> detectionRates;
        ConditionalQuery query;
    };

} // namespace cyberrisk

/**
 * @brief Reads a loss-expectancy scenario.
 *
 * Required keys: asset_value <min> <mode> <max>, occurrence_counts <c...>,
 * occurrence_probabilities <p...>, lognormal <mu> <sigma>, pareto <scale> <shape>,
 * iterations <n>. Optional: asset_value_threshold, loss_exceedance_threshold,
 * loss_range <lower> <upper>, seed, compute_percentiles <0|1>.
 *
 * The returned parameters are not validated; the simulator does that before sampling.
 *
 * @param filename Path to the scenario file.
 * @return cyberrisk::ScenarioParameters
 * @throws cyberrisk::ConfigReadException if the file cannot be opened, a required key is
 *         missing, a value is not a number or a key has the wrong number of values.
 */
cyberrisk::ScenarioParameters readScenarioParameters(const std::string& filename);

/**
 * @brief Reads historical control deployments.
 *
 * One control_counts line per control type (all of equal length), then
 * safeguard_effects and maintenance_loads with one value per period, and optionally
 * control_names with one token per control type.
 *
 * @throws cyberrisk::ConfigReadException on format errors.
 */
cyberrisk::ControlDeploymentMatrix readControlHistory(const std::string& filename);

/**
 * @brief Reads an optimization spec.
 *
 * Keys: current_deployment, unit_costs, safeguard_target, maintenance_limit and exactly
 * one of addition_limits (units that may be added) or deployment_caps (total units
 * allowed per type). fit_intercept <0|1> is optional.
 *
 * @throws cyberrisk::ConfigReadException on format errors.
 * @throws cyberrisk::ConfigReadException (MissingKey) if both or neither limit keys are present.
 */
cyberrisk::OptimizationConfig readOptimizationSpec(const std::string& filename);

/**
 * @brief Reads a joint observation table, detection rates and query.
 *
 * One table_row line per Y level; detection_rates is required. Optional keys:
 * total_trials (defaults to the table sum), x_levels, y_levels, marginal_y,
 * sum_range <lower> <upper>, posterior_y, x_range <lower> <upper>.
 *
 * @throws cyberrisk::ConfigReadException on format errors.
 * @throws cyberrisk::InvalidParameterException if the table itself is invalid.
 */
cyberrisk::JointTableConfig readJointObservationTable(const std::string& filename);

/**
 * @brief Reads "name value" solver settings for ILinearProgramSolver::configure.
 *
 * @throws cyberrisk::ConfigReadException on format errors.
 */
std::map<std::string, double> readSolverSettings(const std::string& filename);

#endif // READ_RISK_CONFIGURATION_HPP
