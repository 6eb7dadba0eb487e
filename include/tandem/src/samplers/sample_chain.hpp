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

#ifndef TANDEM_SAMPLERS_SAMPLE_CHAIN_HPP_
#define TANDEM_SAMPLERS_SAMPLE_CHAIN_HPP_

namespace tandem {

/*
 * Repeatedly applies `kernel` starting from `initial_state`, where
 * iteration i (starting at one) uses the i^th key obtained by splitting
 * `key`.  Any kernel with the signature
 *
 *   std::pair<State, Info> kernel(const RandomKey &, const State &)
 *
 * can be used, in particular both HMCKernel and CoupledHMCKernel.  Running
 * two kernels with the same `key` therefore feeds them identical random
 * inputs.
 *
 * Returns the `max_iterations` states following the initial state, the
 * transition info is only handed to the callback.
 */
template <typename KernelType, typename StateType,
          typename CallbackFunc = NullCallback>
std::vector<StateType> sample_chain(const KernelType &kernel,
                                    const RandomKey &key,
                                    const StateType &initial_state,
                                    std::size_t max_iterations,
                                    CallbackFunc &&callback = NullCallback()) {
  const auto keys = split(key, max_iterations);

  std::vector<StateType> output;
  output.reserve(max_iterations);

  StateType state(initial_state);
  for (std::size_t iter = 1; iter <= max_iterations; ++iter) {
    auto [next_state, info] = kernel(keys[iter - 1], state);
    callback(iter, next_state, info);
    output.push_back(next_state);
    state = std::move(next_state);
  }
  return output;
}

} // namespace tandem

#endif /* TANDEM_SAMPLERS_SAMPLE_CHAIN_HPP_ */
