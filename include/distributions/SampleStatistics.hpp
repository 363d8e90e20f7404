#ifndef SAMPLE_STATISTICS_HPP
#define SAMPLE_STATISTICS_HPP

#include <vector>

namespace cyberrisk {

    /**
     * @brief P50/P75/P90/P95/P99 of a sample, non-decreasing by construction.
     */
    struct PercentileBreakdown {
        double p50 = 0.0;
        double p75 = 0.0;
        double p90 = 0.0;
        double p95 = 0.0;
        double p99 = 0.0;
    };

    /**
     * @class SampleStatistics
     * @brief Reductions over simulated sample vectors.
     *
     * Moments stream through Boost.Accumulators; order statistics use GSL's
     * sorted-data routines with linear interpolation between order statistics.
     */
    class SampleStatistics {
    public:
        SampleStatistics() = delete;

        /**
         * @brief Arithmetic mean.
         * @throws InvalidParameterException if values is empty.
         */
        static double mean(const std::vector<double>& values);

        /**
         * @brief Population variance (divides by n).
         * @throws InvalidParameterException if values is empty.
         */
        static double variance(const std::vector<double>& values);

        /**
         * @brief Median of the sample. The input is copied and sorted.
         * @throws InvalidParameterException if values is empty.
         */
        static double median(const std::vector<double>& values);

        /**
         * @brief Interpolated quantile of already sorted data.
         * @param sortedValues Ascending sample.
         * @param fraction Quantile level in [0, 1].
         * @throws InvalidParameterException on empty data or a level outside [0, 1].
         */
        static double quantileFromSorted(const std::vector<double>& sortedValues, double fraction);

        /**
         * @brief Percentile breakdown of already sorted data.
         */
        static PercentileBreakdown percentilesFromSorted(const std::vector<double>& sortedValues);

        /**
         * @brief Percentile breakdown of an unsorted sample.
         */
        static PercentileBreakdown percentiles(const std::vector<double>& values);

        /** @brief Fraction of values <= threshold. */
        static double fractionAtMost(const std::vector<double>& values, double threshold);

        /** @brief Fraction of values >= threshold. */
        static double fractionAtLeast(const std::vector<double>& values, double threshold);

        /** @brief Fraction of values in [lower, upper]. */
        static double fractionWithin(const std::vector<double>& values, double lower, double upper);
    };

} // namespace cyberrisk

#endif // SAMPLE_STATISTICS_HPP
