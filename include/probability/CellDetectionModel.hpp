#ifndef CELL_DETECTION_MODEL_HPP
#define CELL_DETECTION_MODEL_HPP

#include "probability/interfaces/IDetectionModel.hpp"

namespace cyberrisk {

/**
 * @brief P(T = positive | X = x, Y = y) given per cell.
 *
 * The likelihood matrix has the table's layout: rows Y, columns X.
 */
class CellDetectionModel : public IDetectionModel {
public:
    /**
     * @throws InvalidParameterException if any likelihood is outside [0, 1].
     */
    explicit CellDetectionModel(const Eigen::MatrixXd& likelihoods);

    Eigen::VectorXd positiveMassByY(const JointObservationTable& table) const override;
    std::string describe() const override;

    const Eigen::MatrixXd& getLikelihoods() const { return likelihoods; }

private:
    Eigen::MatrixXd likelihoods;
};

} // namespace cyberrisk

#endif // CELL_DETECTION_MODEL_HPP
