#ifndef MARGINAL_DETECTION_MODEL_HPP
#define MARGINAL_DETECTION_MODEL_HPP

#include "probability/interfaces/IDetectionModel.hpp"
#include <vector>

namespace cyberrisk {

/**
 * @brief Detection rates given per X level and for all but the last Y level.
 *
 * P(T) follows from the X side by total probability:
 *   P(T) = sum_x P(T | X = x) P(X = x).
 * The Y side then fixes the remaining likelihood:
 *   P(T | Y = y_last) = (P(T) - sum_{y != y_last} P(T | Y = y) P(Y = y)) / P(Y = y_last).
 *
 * For the default 3 x 4 table this is the six-rate layout
 * [P(T|X=2), P(T|X=3), P(T|X=4), P(T|X=5), P(T|Y=6), P(T|Y=7)].
 */
class MarginalDetectionModel : public IDetectionModel {
public:
    /**
     * @param xRates P(T | X = x), one per X level.
     * @param yRates P(T | Y = y), one per Y level except the last.
     * @throws InvalidParameterException if any rate is outside [0, 1].
     */
    MarginalDetectionModel(const Eigen::VectorXd& xRates, const Eigen::VectorXd& yRates);

    /**
     * @brief Split a flat rate list into X and Y rates for the given table.
     *
     * The first table.cols() entries are X rates, the remaining table.rows() - 1 are Y rates.
     * @throws InvalidParameterException if the list length is not cols + rows - 1.
     */
    static MarginalDetectionModel fromRateList(const std::vector<double>& rates,
                                               const JointObservationTable& table);

    /**
     * @throws InvalidParameterException if the rates do not match the table shape, or the
     *         derived P(T | Y = y_last) falls outside [0, 1].
     * @throws DivisionByZeroException if the last Y level has zero probability.
     */
    Eigen::VectorXd positiveMassByY(const JointObservationTable& table) const override;

    std::string describe() const override;

    /** @brief The derived P(T | Y = y_last) for the given table. */
    double derivedLastYLikelihood(const JointObservationTable& table) const;

    const Eigen::VectorXd& getXRates() const { return xRates; }
    const Eigen::VectorXd& getYRates() const { return yRates; }

private:
    void checkShape(const JointObservationTable& table) const;

    Eigen::VectorXd xRates;
    Eigen::VectorXd yRates;
};

} // namespace cyberrisk

#endif // MARGINAL_DETECTION_MODEL_HPP
