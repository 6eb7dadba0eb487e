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

#ifndef INCLUDE_TANDEM_SRC_DETAILS_TYPECAST_HPP_
#define INCLUDE_TANDEM_SRC_DETAILS_TYPECAST_HPP_

namespace tandem {

namespace cast {

inline std::size_t to_size(Eigen::Index input) {
  TANDEM_ASSERT(input >= 0);
  return static_cast<std::size_t>(input);
}

inline Eigen::Index to_index(std::size_t input) {
  TANDEM_ASSERT(input <= to_size(std::numeric_limits<Eigen::Index>::max()));
  return static_cast<Eigen::Index>(input);
}

// 2^53 is the largest value of type `double` with integer precision,
// iteration counts above it can't be represented exactly.
constexpr std::size_t kMaxIntegerPrecisionDoubleSize = 1ULL << 53;

inline double to_double(std::size_t input) {
  TANDEM_ASSERT(input <= kMaxIntegerPrecisionDoubleSize);
  return static_cast<double>(input);
}

inline double to_double(Eigen::Index input) {
  TANDEM_ASSERT(input >= 0);
  return to_double(to_size(input));
}

} // namespace cast

} // namespace tandem

#endif /* INCLUDE_TANDEM_SRC_DETAILS_TYPECAST_HPP_ */
