#include <cmath>
#include <fstream>
#include <limits>
#include <set>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>
#include "utils/ReadRiskConfiguration.hpp"
#include "utils/Logger.hpp"
#include "exceptions/ConfigReadException.hpp"

using cyberrisk::ConfigReadException;
using ErrorType = cyberrisk::ConfigReadException::ErrorType;

namespace {

struct ConfigEntry {
    std::string key;
    std::vector<std::string> values;
    int line = 0;
};

std::vector<ConfigEntry> readEntries(const std::string& filename, const std::string& caller) {
    std::ifstream file(filename);
    if (!file.is_open()) {
        cyberrisk::Logger::getInstance().error(caller, "Unable to open configuration file: " + filename);
        throw ConfigReadException(ErrorType::FileOpenError, caller, filename);
    }

    std::vector<ConfigEntry> entries;
    std::string line;
    int line_number = 0;
    while (std::getline(file, line)) {
        line_number++;
        const auto comment = line.find('#');
        if (comment != std::string::npos) {
            line.erase(comment);
        }
        std::istringstream iss(line);
        ConfigEntry entry;
        if (!(iss >> entry.key)) continue;
        entry.line = line_number;
        std::string token;
        while (iss >> token) {
            entry.values.push_back(token);
        }
        entries.push_back(std::move(entry));
    }
    return entries;
}

std::string where(const ConfigEntry& entry) {
    return "'" + entry.key + "' on line " + std::to_string(entry.line);
}

double toDouble(const std::string& token, const ConfigEntry& entry, const std::string& caller) {
    std::size_t consumed = 0;
    double value = 0.0;
    try {
        value = std::stod(token, &consumed);
    } catch (const std::invalid_argument&) {
        throw ConfigReadException(ErrorType::InvalidNumberFormat, caller, "'" + token + "' for " + where(entry));
    } catch (const std::out_of_range&) {
        throw ConfigReadException(ErrorType::InvalidNumberFormat, caller, "'" + token + "' is out of range for " + where(entry));
    }
    if (consumed != token.size()) {
        throw ConfigReadException(ErrorType::InvalidNumberFormat, caller, "'" + token + "' for " + where(entry));
    }
    return value;
}

template <typename Integer>
Integer toWholeNumber(const std::string& token, const ConfigEntry& entry, const std::string& caller) {
    const double value = toDouble(token, entry, caller);
    if (!std::isfinite(value) || value < 0.0 || std::floor(value) != value) {
        throw ConfigReadException(ErrorType::InvalidNumberFormat, caller,
                                  "'" + token + "' is not a non-negative whole number for " + where(entry));
    }
    // 2^digits is the smallest power of two Integer cannot hold
    if (value >= std::ldexp(1.0, std::numeric_limits<Integer>::digits)) {
        throw ConfigReadException(ErrorType::InvalidNumberFormat, caller,
                                  "'" + token + "' is too large for " + where(entry));
    }
    return static_cast<Integer>(value);
}

std::vector<double> toDoubles(const ConfigEntry& entry, const std::string& caller) {
    if (entry.values.empty()) {
        throw ConfigReadException(ErrorType::WrongValueCount, caller, "no values for " + where(entry));
    }
    std::vector<double> values;
    values.reserve(entry.values.size());
    for (const auto& token : entry.values) {
        values.push_back(toDouble(token, entry, caller));
    }
    return values;
}

std::vector<double> toDoubles(const ConfigEntry& entry, std::size_t expected, const std::string& caller) {
    if (entry.values.size() != expected) {
        throw ConfigReadException(ErrorType::WrongValueCount, caller,
            "expected " + std::to_string(expected) + " got " + std::to_string(entry.values.size()) +
            " for " + where(entry));
    }
    return toDoubles(entry, caller);
}

Eigen::VectorXd toVector(const std::vector<double>& values) {
    Eigen::VectorXd v(static_cast<Eigen::Index>(values.size()));
    for (std::size_t i = 0; i < values.size(); ++i) {
        v(static_cast<Eigen::Index>(i)) = values[i];
    }
    return v;
}

// Later lines override earlier ones for single-valued keys.
const ConfigEntry* find(const std::vector<ConfigEntry>& entries, const std::string& key) {
    const ConfigEntry* found = nullptr;
    for (const auto& entry : entries) {
        if (entry.key == key) found = &entry;
    }
    return found;
}

const ConfigEntry& require(const std::vector<ConfigEntry>& entries, const std::string& key,
                           const std::string& filename, const std::string& caller) {
    const ConfigEntry* entry = find(entries, key);
    if (!entry) {
        throw ConfigReadException(ErrorType::MissingKey, caller, "'" + key + "' in " + filename);
    }
    return *entry;
}

double requireScalar(const std::vector<ConfigEntry>& entries, const std::string& key,
                     const std::string& filename, const std::string& caller) {
    return toDoubles(require(entries, key, filename, caller), 1, caller)[0];
}

bool toFlag(const ConfigEntry& entry, const std::string& caller) {
    return toDoubles(entry, 1, caller)[0] != 0.0;
}

void warnUnknownKeys(const std::vector<ConfigEntry>& entries, const std::set<std::string>& known,
                     const std::string& caller) {
    for (const auto& entry : entries) {
        if (known.count(entry.key) == 0) {
            cyberrisk::Logger::getInstance().warning(caller, "Unrecognized key " + where(entry) + ". Ignoring.");
        }
    }
}

} // namespace

cyberrisk::ScenarioParameters readScenarioParameters(const std::string& filename) {
    const std::string F_NAME = "readScenarioParameters";
    const auto entries = readEntries(filename, F_NAME);
    warnUnknownKeys(entries, {"asset_value", "occurrence_counts", "occurrence_probabilities", "lognormal",
                              "pareto", "asset_value_threshold", "loss_exceedance_threshold", "loss_range",
                              "iterations", "seed", "compute_percentiles"}, F_NAME);

    cyberrisk::ScenarioParameters params;

    const auto asset = toDoubles(require(entries, "asset_value", filename, F_NAME), 3, F_NAME);
    params.assetValueMin = asset[0];
    params.assetValueMode = asset[1];
    params.assetValueMax = asset[2];

    params.occurrenceCounts = toDoubles(require(entries, "occurrence_counts", filename, F_NAME), F_NAME);
    params.occurrenceProbabilities = toDoubles(require(entries, "occurrence_probabilities", filename, F_NAME), F_NAME);

    const auto lognormal = toDoubles(require(entries, "lognormal", filename, F_NAME), 2, F_NAME);
    params.lossMu = lognormal[0];
    params.lossSigma = lognormal[1];

    const auto pareto = toDoubles(require(entries, "pareto", filename, F_NAME), 2, F_NAME);
    params.paretoScale = pareto[0];
    params.paretoShape = pareto[1];

    if (const auto* e = find(entries, "asset_value_threshold")) {
        params.assetValueThreshold = toDoubles(*e, 1, F_NAME)[0];
    }
    if (const auto* e = find(entries, "loss_exceedance_threshold")) {
        params.lossExceedanceThreshold = toDoubles(*e, 1, F_NAME)[0];
    }
    if (const auto* e = find(entries, "loss_range")) {
        const auto range = toDoubles(*e, 2, F_NAME);
        params.lossRangeLower = range[0];
        params.lossRangeUpper = range[1];
    }

    const ConfigEntry& iterations = require(entries, "iterations", filename, F_NAME);
    toDoubles(iterations, 1, F_NAME);
    params.iterations = static_cast<std::size_t>(toWholeNumber<long>(iterations.values[0], iterations, F_NAME));

    if (const auto* e = find(entries, "seed")) {
        toDoubles(*e, 1, F_NAME);
        params.seed = toWholeNumber<unsigned long>(e->values[0], *e, F_NAME);
    }
    if (const auto* e = find(entries, "compute_percentiles")) {
        params.computePercentiles = toFlag(*e, F_NAME);
    }

    cyberrisk::Logger::getInstance().info(F_NAME, "Scenario loaded from: " + filename);
    return params;
}

cyberrisk::ControlDeploymentMatrix readControlHistory(const std::string& filename) {
    const std::string F_NAME = "readControlHistory";
    const auto entries = readEntries(filename, F_NAME);
    warnUnknownKeys(entries, {"control_counts", "safeguard_effects", "maintenance_loads", "control_names"}, F_NAME);

    std::vector<std::vector<double>> rows;
    for (const auto& entry : entries) {
        if (entry.key != "control_counts") continue;
        rows.push_back(toDoubles(entry, F_NAME));
        if (rows.back().size() != rows.front().size()) {
            throw ConfigReadException(ErrorType::WrongValueCount, F_NAME,
                "expected " + std::to_string(rows.front().size()) + " periods, got " +
                std::to_string(rows.back().size()) + " for " + where(entry));
        }
    }
    if (rows.empty()) {
        throw ConfigReadException(ErrorType::MissingKey, F_NAME, "'control_counts' in " + filename);
    }
    const std::size_t periods = rows.front().size();

    cyberrisk::ControlDeploymentMatrix history;
    history.counts.resize(static_cast<Eigen::Index>(rows.size()), static_cast<Eigen::Index>(periods));
    for (std::size_t r = 0; r < rows.size(); ++r) {
        history.counts.row(static_cast<Eigen::Index>(r)) = toVector(rows[r]).transpose();
    }
    history.safeguardEffects = toVector(toDoubles(require(entries, "safeguard_effects", filename, F_NAME), periods, F_NAME));
    history.maintenanceLoads = toVector(toDoubles(require(entries, "maintenance_loads", filename, F_NAME), periods, F_NAME));

    if (const auto* e = find(entries, "control_names")) {
        if (e->values.size() != rows.size()) {
            throw ConfigReadException(ErrorType::WrongValueCount, F_NAME,
                "expected " + std::to_string(rows.size()) + " names for " + where(*e));
        }
        history.controlNames = e->values;
    }

    cyberrisk::Logger::getInstance().info(F_NAME, "Loaded " + std::to_string(rows.size()) + " control types over " +
                                          std::to_string(periods) + " periods from: " + filename);
    return history;
}

cyberrisk::OptimizationConfig readOptimizationSpec(const std::string& filename) {
    const std::string F_NAME = "readOptimizationSpec";
    const auto entries = readEntries(filename, F_NAME);
    warnUnknownKeys(entries, {"current_deployment", "unit_costs", "addition_limits", "deployment_caps",
                              "safeguard_target", "maintenance_limit", "fit_intercept"}, F_NAME);

    const auto current = toVector(toDoubles(require(entries, "current_deployment", filename, F_NAME), F_NAME));
    const std::size_t k = static_cast<std::size_t>(current.size());
    const auto costs = toVector(toDoubles(require(entries, "unit_costs", filename, F_NAME), k, F_NAME));
    const double target = requireScalar(entries, "safeguard_target", filename, F_NAME);
    const double limit = requireScalar(entries, "maintenance_limit", filename, F_NAME);

    const ConfigEntry* additions = find(entries, "addition_limits");
    const ConfigEntry* caps = find(entries, "deployment_caps");
    if ((additions == nullptr) == (caps == nullptr)) {
        throw ConfigReadException(ErrorType::MissingKey, F_NAME,
            "exactly one of 'addition_limits' or 'deployment_caps' in " + filename);
    }

    cyberrisk::OptimizationConfig config;
    if (additions) {
        config.spec.currentDeployment = current;
        config.spec.unitCosts = costs;
        config.spec.additionLimits = toVector(toDoubles(*additions, k, F_NAME));
        config.spec.safeguardTarget = target;
        config.spec.maintenanceLimit = limit;
    } else {
        config.spec = cyberrisk::OptimizationSpec::fromDeploymentCaps(
            current, costs, toVector(toDoubles(*caps, k, F_NAME)), target, limit);
    }
    if (const auto* e = find(entries, "fit_intercept")) {
        config.fitIntercept = toFlag(*e, F_NAME);
    }

    cyberrisk::Logger::getInstance().info(F_NAME, "Optimization settings loaded from: " + filename);
    return config;
}

cyberrisk::JointTableConfig readJointObservationTable(const std::string& filename) {
    const std::string F_NAME = "readJointObservationTable";
    const auto entries = readEntries(filename, F_NAME);
    warnUnknownKeys(entries, {"table_row", "total_trials", "x_levels", "y_levels", "detection_rates",
                              "marginal_y", "sum_range", "posterior_y", "x_range"}, F_NAME);

    std::vector<std::vector<int>> rows;
    for (const auto& entry : entries) {
        if (entry.key != "table_row") continue;
        toDoubles(entry, F_NAME);
        std::vector<int> row;
        for (const auto& token : entry.values) {
            row.push_back(toWholeNumber<int>(token, entry, F_NAME));
        }
        if (!rows.empty() && row.size() != rows.front().size()) {
            throw ConfigReadException(ErrorType::WrongValueCount, F_NAME,
                "expected " + std::to_string(rows.front().size()) + " columns, got " +
                std::to_string(row.size()) + " for " + where(entry));
        }
        rows.push_back(std::move(row));
    }
    if (rows.empty()) {
        throw ConfigReadException(ErrorType::MissingKey, F_NAME, "'table_row' in " + filename);
    }

    Eigen::MatrixXi counts(static_cast<Eigen::Index>(rows.size()), static_cast<Eigen::Index>(rows.front().size()));
    long sum = 0;
    for (std::size_t r = 0; r < rows.size(); ++r) {
        for (std::size_t c = 0; c < rows[r].size(); ++c) {
            counts(static_cast<Eigen::Index>(r), static_cast<Eigen::Index>(c)) = rows[r][c];
            sum += rows[r][c];
        }
    }

    long totalTrials = sum;
    if (const auto* e = find(entries, "total_trials")) {
        toDoubles(*e, 1, F_NAME);
        totalTrials = toWholeNumber<long>(e->values[0], *e, F_NAME);
    }

    const Eigen::VectorXd xLevels = find(entries, "x_levels")
        ? toVector(toDoubles(*find(entries, "x_levels"), static_cast<std::size_t>(counts.cols()), F_NAME))
        : cyberrisk::JointObservationTable::defaultXLevels();
    const Eigen::VectorXd yLevels = find(entries, "y_levels")
        ? toVector(toDoubles(*find(entries, "y_levels"), static_cast<std::size_t>(counts.rows()), F_NAME))
        : cyberrisk::JointObservationTable::defaultYLevels();

    cyberrisk::ConditionalQuery query;
    if (const auto* e = find(entries, "marginal_y")) {
        query.marginalYLevel = toDoubles(*e, 1, F_NAME)[0];
    }
    if (const auto* e = find(entries, "sum_range")) {
        const auto range = toDoubles(*e, 2, F_NAME);
        query.sumLower = range[0];
        query.sumUpper = range[1];
    }
    if (const auto* e = find(entries, "posterior_y")) {
        query.posteriorYLevel = toDoubles(*e, 1, F_NAME)[0];
    }
    if (const auto* e = find(entries, "x_range")) {
        const auto range = toDoubles(*e, 2, F_NAME);
        query.xRangeLower = range[0];
        query.xRangeUpper = range[1];
    }

    std::vector<double> rates = toDoubles(require(entries, "detection_rates", filename, F_NAME), F_NAME);

    cyberrisk::JointTableConfig config{
        cyberrisk::JointObservationTable(counts, totalTrials, xLevels, yLevels),
        std::move(rates),
        query
    };
    cyberrisk::Logger::getInstance().info(F_NAME, "Joint table (" + std::to_string(counts.rows()) + " x " +
                                          std::to_string(counts.cols()) + ", N=" + std::to_string(totalTrials) +
                                          ") loaded from: " + filename);
    return config;
}

std::map<std::string, double> readSolverSettings(const std::string& filename) {
    const std::string F_NAME = "readSolverSettings";
    const auto entries = readEntries(filename, F_NAME);
    std::map<std::string, double> settings;
    for (const auto& entry : entries) {
        settings[entry.key] = toDoubles(entry, 1, F_NAME)[0];
    }
    return settings;
}
