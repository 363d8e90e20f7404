#include "distributions/SampleStatistics.hpp"
#include "core/RiskConstants.hpp"
#include "exceptions/Exceptions.hpp"
#include <algorithm>
#include <gsl/gsl_statistics_double.h>
#include <boost/accumulators/accumulators.hpp>
#include <boost/accumulators/statistics/stats.hpp>
#include <boost/accumulators/statistics/mean.hpp>
#include <boost/accumulators/statistics/variance.hpp>

namespace acc = boost::accumulators;

namespace cyberrisk {

namespace {

    using MomentAccumulator = acc::accumulator_set<double, acc::stats<acc::tag::mean, acc::tag::variance>>;

    MomentAccumulator accumulate(const std::vector<double>& values, const std::string& caller) {
        if (values.empty()) {
            THROW_INVALID_PARAM(caller, "cannot reduce an empty sample.");
        }
        MomentAccumulator moments;
        for (double v : values) {
            moments(v);
        }
        return moments;
    }

    template <typename Predicate>
    double fractionWhere(const std::vector<double>& values, Predicate predicate) {
        if (values.empty()) {
            THROW_INVALID_PARAM("SampleStatistics::fraction", "cannot estimate a probability from an empty sample.");
        }
        const auto hits = std::count_if(values.begin(), values.end(), predicate);
        return static_cast<double>(hits) / static_cast<double>(values.size());
    }

} // namespace

    double SampleStatistics::mean(const std::vector<double>& values) {
        return acc::mean(accumulate(values, "SampleStatistics::mean"));
    }

    double SampleStatistics::variance(const std::vector<double>& values) {
        return acc::variance(accumulate(values, "SampleStatistics::variance"));
    }

    double SampleStatistics::median(const std::vector<double>& values) {
        if (values.empty()) {
            THROW_INVALID_PARAM("SampleStatistics::median", "cannot take the median of an empty sample.");
        }
        std::vector<double> sorted(values);
        std::sort(sorted.begin(), sorted.end());
        return gsl_stats_median_from_sorted_data(sorted.data(), 1, sorted.size());
    }

    double SampleStatistics::quantileFromSorted(const std::vector<double>& sortedValues, double fraction) {
        if (sortedValues.empty()) {
            THROW_INVALID_PARAM("SampleStatistics::quantileFromSorted", "cannot take a quantile of an empty sample.");
        }
        if (!(fraction >= 0.0 && fraction <= 1.0)) {
            THROW_INVALID_PARAM("SampleStatistics::quantileFromSorted",
                                "quantile level " + std::to_string(fraction) + " is outside [0, 1].");
        }
        return gsl_stats_quantile_from_sorted_data(sortedValues.data(), 1, sortedValues.size(), fraction);
    }

    PercentileBreakdown SampleStatistics::percentilesFromSorted(const std::vector<double>& sortedValues) {
        const auto& levels = constants::PERCENTILE_LEVELS;
        PercentileBreakdown breakdown;
        breakdown.p50 = quantileFromSorted(sortedValues, levels[0]);
        breakdown.p75 = quantileFromSorted(sortedValues, levels[1]);
        breakdown.p90 = quantileFromSorted(sortedValues, levels[2]);
        breakdown.p95 = quantileFromSorted(sortedValues, levels[3]);
        breakdown.p99 = quantileFromSorted(sortedValues, levels[4]);
        return breakdown;
    }

    PercentileBreakdown SampleStatistics::percentiles(const std::vector<double>& values) {
        std::vector<double> sorted(values);
        std::sort(sorted.begin(), sorted.end());
        return percentilesFromSorted(sorted);
    }

    double SampleStatistics::fractionAtMost(const std::vector<double>& values, double threshold) {
        return fractionWhere(values, [threshold](double v) { return v <= threshold; });
    }

    double SampleStatistics::fractionAtLeast(const std::vector<double>& values, double threshold) {
        return fractionWhere(values, [threshold](double v) { return v >= threshold; });
    }

    double SampleStatistics::fractionWithin(const std::vector<double>& values, double lower, double upper) {
        return fractionWhere(values, [lower, upper](double v) { return v >= lower && v <= upper; });
    }

} // namespace cyberrisk
