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

#ifndef TANDEM_HMC_INTEGRATORS_HPP_
#define TANDEM_HMC_INTEGRATORS_HPP_

namespace tandem {

/*
 * A point in phase space along with the potential energy and its gradient
 * evaluated at `position`.  Integrators always recompute the latter two
 * whenever they move the position so the three stay consistent.
 */
struct IntegratorState {
  Position position;
  Momentum momentum;
  double potential_energy;
  ArrayTree potential_energy_grad;

  bool operator==(const IntegratorState &other) const {
    return (position == other.position && momentum == other.momentum &&
            potential_energy == other.potential_energy &&
            potential_energy_grad == other.potential_energy_grad);
  }
};

/*
 * Creates the state of a chain at `position`, the momentum is zero
 * until a transition samples one.
 */
template <typename PotentialType>
inline IntegratorState new_state(const Position &position,
                                 const PotentialType &potential) {
  const auto value_and_grad = potential.value_and_gradient(position);
  return {position, zeros_like(position), value_and_grad.first,
          value_and_grad.second};
}

inline IntegratorState flip_momentum(const IntegratorState &state) {
  IntegratorState flipped(state);
  flipped.momentum = -state.momentum;
  return flipped;
}

namespace details {

template <typename PotentialType>
inline void update_position(const PotentialType &potential,
                            const GaussianEuclideanMetric &metric,
                            double step_size, IntegratorState *state) {
  state->position += step_size * metric.velocity(state->momentum);
  auto value_and_grad = potential.value_and_gradient(state->position);
  state->potential_energy = value_and_grad.first;
  state->potential_energy_grad = std::move(value_and_grad.second);
}

inline void update_momentum(double step_size, IntegratorState *state) {
  state->momentum -= step_size * state->potential_energy_grad;
}

} // namespace details

/*
 * The velocity Verlet (leapfrog) integrator,
 *
 *   p_{1/2} = p - eps / 2 * dU/dx(x)
 *   x'      = x + eps * M^{-1} p_{1/2}
 *   p'      = p_{1/2} - eps / 2 * dU/dx(x')
 *
 * It's second order, symplectic and time reversible and needs a single
 * gradient evaluation per step.
 */
template <typename PotentialType> class VelocityVerlet {
public:
  VelocityVerlet(const PotentialType &potential,
                 const GaussianEuclideanMetric &metric)
      : potential_(potential), metric_(metric){};

  IntegratorState operator()(const IntegratorState &state,
                             double step_size) const {
    IntegratorState next(state);
    details::update_momentum(0.5 * step_size, &next);
    details::update_position(potential_, metric_, step_size, &next);
    details::update_momentum(0.5 * step_size, &next);
    return next;
  }

  std::size_t gradient_evaluations_per_step() const { return 1; }

private:
  PotentialType potential_;
  GaussianEuclideanMetric metric_;
};

/*
 * Two stage palindromic integrator with the coefficient which minimizes
 * the norm of the leading error term,
 *
 *   McLachlan, R. I. "On the numerical integration of ordinary differential
 *   equations by symmetric composition methods." SIAM (1995)
 *
 * Twice the cost of velocity Verlet per step but with a noticeably smaller
 * energy error, so it can usually afford larger steps.
 */
template <typename PotentialType> class McLachlan {
public:
  static constexpr double kB1 = 0.1932;

  McLachlan(const PotentialType &potential,
            const GaussianEuclideanMetric &metric)
      : potential_(potential), metric_(metric){};

  IntegratorState operator()(const IntegratorState &state,
                             double step_size) const {
    IntegratorState next(state);
    details::update_momentum(kB1 * step_size, &next);
    details::update_position(potential_, metric_, 0.5 * step_size, &next);
    details::update_momentum((1. - 2. * kB1) * step_size, &next);
    details::update_position(potential_, metric_, 0.5 * step_size, &next);
    details::update_momentum(kB1 * step_size, &next);
    return next;
  }

  std::size_t gradient_evaluations_per_step() const { return 2; }

private:
  PotentialType potential_;
  GaussianEuclideanMetric metric_;
};

} // namespace tandem

#endif /* TANDEM_HMC_INTEGRATORS_HPP_ */
