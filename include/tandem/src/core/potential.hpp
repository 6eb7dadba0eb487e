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

#ifndef TANDEM_CORE_POTENTIAL_HPP_
#define TANDEM_CORE_POTENTIAL_HPP_

namespace tandem {

/*
 * A potential is the negative log density of the target distribution.
 * The samplers only need two things from it,
 *
 *   double operator()(const ArrayTree &position) const;
 *   std::pair<double, ArrayTree> value_and_gradient(const ArrayTree &) const;
 *
 * so any type which provides those can be used directly.  The helpers
 * below wrap plain callables for the two usual situations: an analytic
 * gradient is available, or it isn't and we fall back on finite
 * differences.
 */
template <typename ValueFunction, typename GradientFunction>
struct AnalyticPotential {

  AnalyticPotential(ValueFunction value_function_,
                    GradientFunction gradient_function_)
      : value_function(std::move(value_function_)),
        gradient_function(std::move(gradient_function_)){};

  double operator()(const ArrayTree &position) const {
    return value_function(position);
  }

  ArrayTree gradient(const ArrayTree &position) const {
    return gradient_function(position);
  }

  std::pair<double, ArrayTree>
  value_and_gradient(const ArrayTree &position) const {
    return std::make_pair(value_function(position),
                          gradient_function(position));
  }

  ValueFunction value_function;
  GradientFunction gradient_function;
};

template <typename ValueFunction, typename GradientFunction>
inline auto potential_from_functions(ValueFunction &&value_function,
                                     GradientFunction &&gradient_function) {
  return AnalyticPotential<std::decay_t<ValueFunction>,
                           std::decay_t<GradientFunction>>(
      std::forward<ValueFunction>(value_function),
      std::forward<GradientFunction>(gradient_function));
}

/*
 * Approximates the gradient with central differences taken along
 * each element of the flattened position.  This costs 2 * n + 1
 * evaluations of the potential per gradient so it's really only
 * suitable for low dimensional problems.
 *
 * The resulting integrator is still reversible and volume preserving,
 * the gradient is just a (deterministic) approximation, so the
 * Metropolis correction keeps the sampler exact.
 */
template <typename ValueFunction> struct FiniteDifferencePotential {

  FiniteDifferencePotential(ValueFunction value_function_, double epsilon_)
      : value_function(std::move(value_function_)), epsilon(epsilon_){};

  double operator()(const ArrayTree &position) const {
    return value_function(position);
  }

  ArrayTree gradient(const ArrayTree &position) const {
    const Eigen::VectorXd flat = position.flatten();
    Eigen::VectorXd grad(flat.size());
    for (Eigen::Index i = 0; i < flat.size(); ++i) {
      Eigen::VectorXd perturbed(flat);
      perturbed[i] = flat[i] + epsilon;
      const double f_plus = value_function(position.unflatten(perturbed));
      perturbed[i] = flat[i] - epsilon;
      const double f_minus = value_function(position.unflatten(perturbed));
      grad[i] = (f_plus - f_minus) / (2. * epsilon);
    }
    return position.unflatten(grad);
  }

  std::pair<double, ArrayTree>
  value_and_gradient(const ArrayTree &position) const {
    return std::make_pair(value_function(position), gradient(position));
  }

  ValueFunction value_function;
  double epsilon;
};

template <typename ValueFunction>
inline auto finite_difference_potential(ValueFunction &&value_function,
                                        double epsilon = 1e-6) {
  TANDEM_ASSERT(epsilon > 0.);
  return FiniteDifferencePotential<std::decay_t<ValueFunction>>(
      std::forward<ValueFunction>(value_function), epsilon);
}

} // namespace tandem

#endif /* TANDEM_CORE_POTENTIAL_HPP_ */
