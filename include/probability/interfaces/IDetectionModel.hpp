#ifndef I_DETECTION_MODEL_HPP
#define I_DETECTION_MODEL_HPP

#include "probability/JointObservationTable.hpp"
#include <Eigen/Dense>
#include <string>

namespace cyberrisk {

/**
 * @brief Likelihood of a positive downstream test T given the (X, Y) observation.
 *
 * A model reduces a joint table to the positive mass per Y level, P(Y = y, T = positive).
 * Summing that vector gives P(T = positive), and each entry over the sum is the
 * posterior P(Y = y | T = positive).
 */
class IDetectionModel {
public:
    virtual ~IDetectionModel() = default;

    /**
     * @brief P(Y = y, T = positive) for each row of the table.
     * @param table Joint observation table the likelihoods refer to.
     * @return Eigen::VectorXd One entry per Y level.
     * @throws InvalidParameterException if the model does not fit the table shape or
     *         its likelihoods are inconsistent with the table.
     */
    virtual Eigen::VectorXd positiveMassByY(const JointObservationTable& table) const = 0;

    virtual std::string describe() const = 0;
};

} // namespace cyberrisk

#endif // I_DETECTION_MODEL_HPP
