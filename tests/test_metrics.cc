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

#include <tandem/HMC>

#include "test_utils.h"

namespace tandem {

ArrayTree two_array_tree(double a, double b, double c) {
  ArrayTree tree;
  tree["a"] = Eigen::Vector2d(a, b);
  tree["b"] = Eigen::VectorXd::Constant(1, c);
  return tree;
}

TEST(test_metrics, test_diagonal_kinetic_energy_and_velocity) {
  const Eigen::VectorXd inverse_mass = Eigen::Vector3d(0.5, 2., 4.);
  const auto metric = gaussian_euclidean(inverse_mass);
  EXPECT_TRUE(metric.is_diagonal());
  EXPECT_EQ(metric.dimension(), 3);

  const ArrayTree momentum = two_array_tree(1., -2., 3.);
  const double expected = 0.5 * (0.5 * 1. + 2. * 4. + 4. * 9.);
  EXPECT_DOUBLE_EQ(metric.kinetic_energy(momentum), expected);

  const ArrayTree velocity = metric.velocity(momentum);
  EXPECT_TRUE(velocity.has_same_structure(momentum));
  EXPECT_DOUBLE_EQ(velocity.at("a")[0], 0.5);
  EXPECT_DOUBLE_EQ(velocity.at("a")[1], -4.);
  EXPECT_DOUBLE_EQ(velocity.at("b")[0], 12.);
}

TEST(test_metrics, test_dense_kinetic_energy_and_velocity) {
  Eigen::MatrixXd inverse_mass(3, 3);
  inverse_mass << 2., 0.5, 0., 0.5, 1., 0.2, 0., 0.2, 3.;
  const auto metric = gaussian_euclidean(inverse_mass);
  EXPECT_FALSE(metric.is_diagonal());

  const ArrayTree momentum = two_array_tree(1., -2., 3.);
  const Eigen::VectorXd p = momentum.flatten();
  EXPECT_NEAR(metric.kinetic_energy(momentum), 0.5 * p.dot(inverse_mass * p),
              1e-12);

  const Eigen::VectorXd expected_velocity = inverse_mass * p;
  const Eigen::VectorXd velocity = metric.velocity(momentum).flatten();
  EXPECT_LT((velocity - expected_velocity).norm(), 1e-12);
}

TEST(test_metrics, test_column_is_interpreted_as_diagonal) {
  const Eigen::MatrixXd column = Eigen::MatrixXd::Constant(3, 1, 0.1);
  const auto diagonal = metric_from_inverse_mass_matrix(column);
  EXPECT_TRUE(diagonal.is_diagonal());
  EXPECT_EQ(diagonal.dimension(), 3);
  EXPECT_TRUE(diagonal.inverse_mass_matrix() ==
              Eigen::MatrixXd(0.1 * Eigen::MatrixXd::Identity(3, 3)));

  const Eigen::MatrixXd square = 0.1 * Eigen::MatrixXd::Identity(3, 3);
  const auto dense = metric_from_inverse_mass_matrix(square);
  EXPECT_FALSE(dense.is_diagonal());

  const ArrayTree momentum = two_array_tree(1., 2., 3.);
  EXPECT_DOUBLE_EQ(diagonal.kinetic_energy(momentum),
                   dense.kinetic_energy(momentum));
}

TEST(test_metrics, test_momentum_is_deterministic_and_structured) {
  const auto metric = gaussian_euclidean(Eigen::VectorXd(Eigen::Vector3d(1., 2., 3.)));
  const ArrayTree position = two_array_tree(0., 0., 0.);
  const RandomKey key(42);

  const auto momentum = metric.sample_momentum(key, position);
  EXPECT_TRUE(momentum.has_same_structure(position));
  EXPECT_TRUE(bitwise_equal(momentum, metric.sample_momentum(key, position)));
  EXPECT_FALSE(
      bitwise_equal(momentum, metric.sample_momentum(RandomKey(43), position)));
}

TEST(test_metrics, test_diagonal_momentum_distribution) {
  // Momenta are distributed N(0, M) so their variance is the inverse
  // of the inverse mass.
  const Eigen::VectorXd inverse_mass = Eigen::Vector2d(0.1, 4.);
  const auto metric = gaussian_euclidean(inverse_mass);
  ArrayTree position;
  position["x"] = Eigen::Vector2d(0., 0.);

  const std::size_t n = 20000;
  Eigen::Vector2d sum = Eigen::Vector2d::Zero();
  Eigen::Vector2d sum_sq = Eigen::Vector2d::Zero();
  double kinetic = 0.;
  for (const auto &key : split(RandomKey(2012), n)) {
    const auto momentum = metric.sample_momentum(key, position);
    const Eigen::VectorXd p = momentum.flatten();
    sum += p;
    sum_sq += p.cwiseProduct(p);
    kinetic += metric.kinetic_energy(momentum);
  }
  const double dn = cast::to_double(n);
  const Eigen::Vector2d mean = sum / dn;
  const Eigen::Vector2d variance = sum_sq / dn - mean.cwiseProduct(mean);

  EXPECT_NEAR(mean[0], 0., 0.1);
  EXPECT_NEAR(mean[1], 0., 0.02);
  EXPECT_NEAR(variance[0] / 10., 1., 0.05);
  EXPECT_NEAR(variance[1] / 0.25, 1., 0.05);
  // The kinetic energy of a draw is chi-squared / 2 with 2 degrees of freedom.
  EXPECT_NEAR(kinetic / dn, 1., 0.05);
}

TEST(test_metrics, test_dense_momentum_distribution) {
  std::mt19937_64 gen(7);
  const Eigen::MatrixXd inverse_mass =
      random_inverse_mass_matrix(3, 0.5, 2., gen);
  const auto metric = gaussian_euclidean(inverse_mass);
  const Eigen::MatrixXd mass = inverse_mass.inverse();

  ArrayTree position;
  position["x"] = Eigen::Vector3d::Zero();

  const std::size_t n = 20000;
  Eigen::MatrixXd second_moment = Eigen::MatrixXd::Zero(3, 3);
  for (const auto &key : split(RandomKey(11), n)) {
    const Eigen::VectorXd p = metric.sample_momentum(key, position).flatten();
    second_moment += p * p.transpose();
  }
  second_moment /= cast::to_double(n);

  for (Eigen::Index i = 0; i < 3; ++i) {
    for (Eigen::Index j = 0; j < 3; ++j) {
      const double tolerance = 0.05 * std::sqrt(mass(i, i) * mass(j, j));
      EXPECT_NEAR(second_moment(i, j), mass(i, j), tolerance);
    }
  }
}

} // namespace tandem
