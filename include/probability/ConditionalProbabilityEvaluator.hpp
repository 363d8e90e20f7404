#ifndef CONDITIONAL_PROBABILITY_EVALUATOR_HPP
#define CONDITIONAL_PROBABILITY_EVALUATOR_HPP

#include "probability/JointObservationTable.hpp"
#include "probability/interfaces/IDetectionModel.hpp"
#include <limits>

namespace cyberrisk {

    /**
     * @brief The queries answered by ConditionalProbabilityEvaluator::evaluate.
     *
     * Defaults reproduce the standard two-phase screening report: P(Y = 8),
     * P(X + Y <= 10), P(Y = 8 | T) and P(3 <= X <= 4).
     */
    struct ConditionalQuery {
        double marginalYLevel = 8.0;
        double sumLower = -std::numeric_limits<double>::infinity();
        double sumUpper = 10.0;
        double posteriorYLevel = 8.0;
        double xRangeLower = 3.0;
        double xRangeUpper = 4.0;
    };

    struct ConditionalProbabilityResult {
        double pMarginal = 0.0;      ///< P(Y = marginalYLevel)
        double pRange = 0.0;         ///< P(sumLower <= X + Y <= sumUpper)
        double pConditional = 0.0;   ///< P(Y = posteriorYLevel | T = positive)
        double pXRange = 0.0;        ///< P(xRangeLower <= X <= xRangeUpper)
        double pDetection = 0.0;     ///< P(T = positive)
    };

    /**
     * @class ConditionalProbabilityEvaluator
     * @brief Marginal, range and Bayesian queries over a joint observation table.
     *
     * All probabilities are count sums divided by N. Range bounds are inclusive.
     */
    class ConditionalProbabilityEvaluator {
    public:
        explicit ConditionalProbabilityEvaluator(const JointObservationTable& table);

        /**
         * @brief P(Y = y).
         * @throws InvalidParameterException if y is not a Y level of the table.
         */
        double marginalProbabilityY(double y) const;

        /**
         * @brief P(X = x).
         * @throws InvalidParameterException if x is not an X level of the table.
         */
        double marginalProbabilityX(double x) const;

        /** @brief P(lower <= X <= upper). */
        double probabilityXWithin(double lower, double upper) const;

        /** @brief P(lower <= X + Y <= upper). */
        double probabilityOfSumWithin(double lower, double upper) const;

        /** @brief P(T = positive) under the given detection model. */
        double probabilityOfDetection(const IDetectionModel& detection) const;

        /**
         * @brief P(Y = y | T = positive) by Bayes' rule.
         * @throws DivisionByZeroException if P(T = positive) is zero.
         * @throws InvalidParameterException if y is not a Y level of the table.
         */
        double posteriorY(double y, const IDetectionModel& detection) const;

        /**
         * @brief Answer every query of a ConditionalQuery at once.
         */
        ConditionalProbabilityResult evaluate(const ConditionalQuery& query,
                                              const IDetectionModel& detection) const;

        /**
         * @brief P(A | B) = P(A, B) / P(B).
         * @throws DivisionByZeroException if marginal is zero.
         */
        static double conditionalProbability(double joint, double marginal);

        /**
         * @brief P(A | B) = P(B | A) P(A) / P(B).
         * @throws DivisionByZeroException if evidence is zero.
         */
        static double bayesPosterior(double prior, double likelihood, double evidence);

        const JointObservationTable& getTable() const { return table; }

    private:
        JointObservationTable table;
    };

} // namespace cyberrisk

#endif // CONDITIONAL_PROBABILITY_EVALUATOR_HPP
