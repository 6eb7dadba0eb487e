/*
 * Copyright (C) 2026 Swift Navigation Inc.
 * Contact: Swift Navigation <dev@swiftnav.com>
 *
 * This source is subject to the license found in the file 'LICENSE' which must
 * be distributed together with this source. All other rights reserved.
 *
 * THIS CODE AND INFORMATION IS PROVIDED "AS IS" WITHOUT WARRANTY OF ANY KIND,
 * EITHER EXPRESSED OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE IMPLIED
 * WARRANTIES OF MERCHANTABILITY AND/OR FITNESS FOR A PARTICULAR PURPOSE.
 */

#ifndef TANDEM_HMC_METRICS_HPP_
#define TANDEM_HMC_METRICS_HPP_

namespace tandem {

/*
 * The kinetic energy of a Euclidean-Gaussian metric,
 *
 *   K(p) = 1/2 p^T M^{-1} p
 *
 * where M^{-1} is the (diagonal or dense) inverse mass matrix.  Momenta
 * are distributed as exp(-K(p)), ie p ~ N(0, M), and the velocity used
 * to move the position is dK/dp = M^{-1} p.
 *
 * All of these operate on the flattened momentum, the mass matrix must
 * therefore have one row per scalar element of the position.
 */
class GaussianEuclideanMetric {
public:
  GaussianEuclideanMetric(){};

  explicit GaussianEuclideanMetric(
      const Eigen::VectorXd &inverse_mass_diagonal)
      : is_diagonal_(true), inverse_mass_diagonal_(inverse_mass_diagonal) {
    TANDEM_ASSERT(inverse_mass_diagonal_.size() > 0);
    TANDEM_ASSERT((inverse_mass_diagonal_.array() > 0.).all() &&
                  "inverse mass matrix must be positive definite");
    mass_sqrt_diagonal_ = inverse_mass_diagonal_.array().rsqrt().matrix();
  }

  explicit GaussianEuclideanMetric(const Eigen::MatrixXd &inverse_mass_matrix)
      : is_diagonal_(false), inverse_mass_matrix_(inverse_mass_matrix) {
    TANDEM_ASSERT(inverse_mass_matrix_.rows() == inverse_mass_matrix_.cols());
    TANDEM_ASSERT(inverse_mass_matrix_.rows() > 0);
    inverse_mass_llt_.compute(inverse_mass_matrix_);
    TANDEM_ASSERT(inverse_mass_llt_.info() == Eigen::Success &&
                  "inverse mass matrix must be positive definite");
  }

  Eigen::Index dimension() const {
    return is_diagonal_ ? inverse_mass_diagonal_.size()
                        : inverse_mass_matrix_.rows();
  }

  bool is_diagonal() const { return is_diagonal_; }

  /*
   * Draws a momentum with the same structure as `position`.
   */
  Momentum sample_momentum(const RandomKey &key,
                           const Position &position) const {
    TANDEM_ASSERT(position.size() == dimension() &&
                  "mass matrix and position have different dimensions");
    const Eigen::VectorXd z = standard_normal(key, dimension());
    return position.unflatten(scale_standard_normal(z));
  }

  double kinetic_energy(const Momentum &momentum) const {
    const Eigen::VectorXd p = momentum.flatten();
    return 0.5 * p.dot(apply_inverse_mass(p));
  }

  ArrayTree velocity(const Momentum &momentum) const {
    return momentum.unflatten(apply_inverse_mass(momentum.flatten()));
  }

  Eigen::VectorXd apply_inverse_mass(const Eigen::VectorXd &p) const {
    TANDEM_ASSERT(p.size() == dimension() &&
                  "mass matrix and momentum have different dimensions");
    if (is_diagonal_) {
      return inverse_mass_diagonal_.cwiseProduct(p);
    }
    return inverse_mass_matrix_ * p;
  }

  /*
   * The inverse mass matrix as a dense matrix, mostly useful for
   * serialization and inspection.
   */
  Eigen::MatrixXd inverse_mass_matrix() const {
    if (is_diagonal_) {
      return Eigen::MatrixXd(inverse_mass_diagonal_.asDiagonal());
    }
    return inverse_mass_matrix_;
  }

  const Eigen::VectorXd &inverse_mass_diagonal() const {
    return inverse_mass_diagonal_;
  }

private:
  /*
   * Turns z ~ N(0, I) into a draw from N(0, M).  In the dense case we have
   * M^{-1} = L L^T so L^{-T} z has covariance L^{-T} L^{-1} = M.
   */
  Eigen::VectorXd scale_standard_normal(const Eigen::VectorXd &z) const {
    if (is_diagonal_) {
      return mass_sqrt_diagonal_.cwiseProduct(z);
    }
    return inverse_mass_llt_.matrixU().solve(z);
  }

  bool is_diagonal_ = true;
  Eigen::VectorXd inverse_mass_diagonal_;
  Eigen::VectorXd mass_sqrt_diagonal_;
  Eigen::MatrixXd inverse_mass_matrix_;
  Eigen::LLT<Eigen::MatrixXd> inverse_mass_llt_;
};

inline GaussianEuclideanMetric
gaussian_euclidean(const Eigen::VectorXd &inverse_mass_diagonal) {
  return GaussianEuclideanMetric(inverse_mass_diagonal);
}

inline GaussianEuclideanMetric
gaussian_euclidean(const Eigen::MatrixXd &inverse_mass_matrix) {
  return GaussianEuclideanMetric(inverse_mass_matrix);
}

/*
 * A single column is interpreted as the diagonal of the inverse mass
 * matrix, anything else as the full (dense) matrix.
 */
inline GaussianEuclideanMetric
metric_from_inverse_mass_matrix(const Eigen::MatrixXd &inverse_mass_matrix) {
  if (inverse_mass_matrix.cols() == 1) {
    const Eigen::VectorXd diagonal = inverse_mass_matrix.col(0);
    return GaussianEuclideanMetric(diagonal);
  }
  return GaussianEuclideanMetric(inverse_mass_matrix);
}

} // namespace tandem

#endif /* TANDEM_HMC_METRICS_HPP_ */
