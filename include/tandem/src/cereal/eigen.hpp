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

#ifndef TANDEM_CEREAL_EIGEN_HPP_
#define TANDEM_CEREAL_EIGEN_HPP_

namespace cereal {

/*
 * Matrices are stored as their shape followed by the elements in
 * (column major) storage order.
 */
template <class Archive, class _Scalar, int _Rows, int _Cols>
inline void save(Archive &ar, Eigen::Matrix<_Scalar, _Rows, _Cols> const &m,
                 const std::uint32_t) {
  Eigen::Index rows = m.rows();
  Eigen::Index cols = m.cols();
  std::vector<_Scalar> data(m.data(), m.data() + m.size());

  ar(CEREAL_NVP(rows));
  ar(CEREAL_NVP(cols));
  ar(CEREAL_NVP(data));
}

template <class Archive, class _Scalar, int _Rows, int _Cols>
inline void load(Archive &ar, Eigen::Matrix<_Scalar, _Rows, _Cols> &m,
                 const std::uint32_t) {
  Eigen::Index rows;
  Eigen::Index cols;
  std::vector<_Scalar> data;

  ar(CEREAL_NVP(rows));
  ar(CEREAL_NVP(cols));
  ar(CEREAL_NVP(data));

  TANDEM_ASSERT(tandem::cast::to_size(rows * cols) == data.size() &&
                "serialized matrix shape doesn't match its data");
  m.resize(rows, cols);
  std::copy(data.begin(), data.end(), m.data());
}

} // namespace cereal

#endif /* TANDEM_CEREAL_EIGEN_HPP_ */
