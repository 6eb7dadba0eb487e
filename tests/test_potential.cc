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

#include <gtest/gtest.h>

#include <tandem/Core>

#include "test_utils.h"

namespace tandem {

TEST(test_potential, test_analytic_potential) {
  auto value = [](const ArrayTree &x) {
    return 0.5 * x.flatten().squaredNorm();
  };
  auto gradient = [](const ArrayTree &x) { return x; };

  const auto potential = potential_from_functions(value, gradient);

  ArrayTree position;
  position["a"] = Eigen::Vector2d(1., -2.);
  position["b"] = Eigen::VectorXd::Constant(1, 3.);

  EXPECT_DOUBLE_EQ(potential(position), 7.);
  const auto value_and_grad = potential.value_and_gradient(position);
  EXPECT_DOUBLE_EQ(value_and_grad.first, 7.);
  EXPECT_EQ(value_and_grad.second, position);
}

TEST(test_potential, test_finite_difference_matches_analytic) {
  const NormalPotential normal(1., 2.);
  auto value = [&](const ArrayTree &x) { return normal(x); };
  const auto approximate = finite_difference_potential(value);

  ArrayTree position;
  position["x"] = Eigen::Vector3d(-1.3, 0.2, 4.5);
  position["y"] = Eigen::VectorXd::Constant(1, 0.7);

  const auto expected = normal.value_and_gradient(position);
  const auto actual = approximate.value_and_gradient(position);

  EXPECT_DOUBLE_EQ(actual.first, expected.first);
  ASSERT_TRUE(actual.second.has_same_structure(expected.second));
  const Eigen::VectorXd expected_grad = expected.second.flatten();
  const Eigen::VectorXd actual_grad = actual.second.flatten();
  for (Eigen::Index i = 0; i < expected_grad.size(); ++i) {
    EXPECT_NEAR(actual_grad[i], expected_grad[i], 1e-6);
  }
}

TEST(test_potential, test_finite_difference_non_quadratic) {
  auto value = [](const ArrayTree &x) {
    const double v = x.at("x")[0];
    return std::cosh(v) + v * v * v;
  };
  const auto potential = finite_difference_potential(value, 1e-5);

  for (const double v : {-2., -0.5, 0., 0.3, 1.7}) {
    const auto grad = potential.gradient(scalar_tree("x", v));
    EXPECT_NEAR(grad.at("x")[0], std::sinh(v) + 3 * v * v, 1e-6);
  }
}

} // namespace tandem
