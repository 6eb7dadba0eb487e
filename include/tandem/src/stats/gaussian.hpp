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

#ifndef TANDEM_STATS_GAUSSIAN_HPP_
#define TANDEM_STATS_GAUSSIAN_HPP_

namespace tandem {

/*
 * Univariate normal distribution parametrized by its mean and standard
 * deviation, the parametrization Gaussian targets are usually written in.
 */
namespace gaussian {

inline double log_pdf(double x, double mean, double sd) {
  TANDEM_ASSERT(sd > 0.);
  const double z = (x - mean) / sd;
  return -0.5 * z * z - std::log(sd) - 0.5 * std::log(2 * M_PI);
}

// d/dx of -log_pdf, ie the gradient of a Gaussian potential.
inline double potential_gradient(double x, double mean, double sd) {
  return (x - mean) / (sd * sd);
}

inline double cdf(double x, double mean, double sd) {
  TANDEM_ASSERT(sd > 0.);
  return 0.5 * std::erfc(-(x - mean) / (sd * M_SQRT2));
}

} // namespace gaussian

} // namespace tandem

#endif /* TANDEM_STATS_GAUSSIAN_HPP_ */
