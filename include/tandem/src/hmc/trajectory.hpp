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

#ifndef TANDEM_HMC_TRAJECTORY_HPP_
#define TANDEM_HMC_TRAJECTORY_HPP_

namespace tandem {

/*
 * Builds a trajectory by applying the integrator a fixed number of times
 * with a fixed step size, there's no early termination.
 */
template <typename StepFunction> class StaticIntegration {
public:
  StaticIntegration(const StepFunction &step, double step_size,
                    std::size_t num_steps)
      : step_(step), step_size_(step_size), num_steps_(num_steps) {
    TANDEM_ASSERT(step_size_ > 0. && "step size must be positive");
    TANDEM_ASSERT(num_steps_ >= 1 && "need at least one integration step");
  };

  IntegratorState operator()(const IntegratorState &initial_state) const {
    IntegratorState state(initial_state);
    for (std::size_t i = 0; i < num_steps_; ++i) {
      state = step_(state, step_size_);
    }
    return state;
  }

  double step_size() const { return step_size_; }

  std::size_t num_steps() const { return num_steps_; }

private:
  StepFunction step_;
  double step_size_;
  std::size_t num_steps_;
};

template <typename StepFunction>
inline StaticIntegration<StepFunction>
static_integration(const StepFunction &step, double step_size,
                   std::size_t num_steps) {
  return StaticIntegration<StepFunction>(step, step_size, num_steps);
}

} // namespace tandem

#endif /* TANDEM_HMC_TRAJECTORY_HPP_ */
