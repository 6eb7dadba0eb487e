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

#ifndef TANDEM_RANDOM_UTILS_H
#define TANDEM_RANDOM_UTILS_H

namespace tandem {

template <typename _Scalar, int _Rows, int _Cols, typename DistributionType,
          typename RandomNumberGenerator>
void random_fill(Eigen::Matrix<_Scalar, _Rows, _Cols> &matrix,
                 DistributionType &dist, RandomNumberGenerator &rng) {
  // NullaryExpr makes no promise about evaluation order, fill explicitly
  // so the draws land in storage order.
  for (Eigen::Index i = 0; i < matrix.size(); ++i) {
    matrix.data()[i] = dist(rng);
  }
}

template <typename _Scalar, int _Rows, int _Cols,
          typename RandomNumberGenerator>
void gaussian_fill(Eigen::Matrix<_Scalar, _Rows, _Cols> &matrix, double mean,
                   double sd, RandomNumberGenerator &rng) {
  std::normal_distribution<_Scalar> dist(mean, sd);
  random_fill(matrix, dist, rng);
}

template <typename _Scalar, int _Rows, int _Cols,
          typename RandomNumberGenerator>
void gaussian_fill(Eigen::Matrix<_Scalar, _Rows, _Cols> &matrix,
                   RandomNumberGenerator &rng) {
  gaussian_fill(matrix, 0., 1., rng);
}

/*
 * n independent standard normal draws derived from a key.
 */
inline Eigen::VectorXd standard_normal(const RandomKey &key, Eigen::Index n) {
  auto gen = engine_from_key(key);
  Eigen::VectorXd sample(n);
  gaussian_fill(sample, gen);
  return sample;
}

} // namespace tandem

#endif
