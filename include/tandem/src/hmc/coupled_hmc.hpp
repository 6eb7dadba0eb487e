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

#ifndef TANDEM_HMC_COUPLED_HMC_HPP_
#define TANDEM_HMC_COUPLED_HMC_HPP_

namespace tandem {

/*
 * Two chains which are advanced together with common random numbers.
 *
 * Once the two positions are bit for bit identical the chains receive
 * identical inputs from then on, so `is_coupled` never goes back to false.
 */
struct CoupledState {
  IntegratorState state_1;
  IntegratorState state_2;
  bool is_coupled;

  bool operator==(const CoupledState &other) const {
    return (state_1 == other.state_1 && state_2 == other.state_2 &&
            is_coupled == other.is_coupled);
  }
};

struct CoupledHMCInfo {
  HMCInfo info_1;
  HMCInfo info_2;

  bool operator==(const CoupledHMCInfo &other) const {
    return info_1 == other.info_1 && info_2 == other.info_2;
  }
};

template <typename PotentialType>
inline CoupledState new_state(const Position &position_1,
                              const Position &position_2,
                              const PotentialType &potential) {
  return {new_state(position_1, potential), new_state(position_2, potential),
          false};
}

/*
 * Common random number coupling of two HMC chains.  Each transition splits
 * the key exactly as the single chain kernel does and hands the resulting
 * momentum and acceptance keys to both chains.  Because of this the first
 * chain of a coupled run is identical, sample for sample, to a single chain
 * run with the same keys.
 *
 * Before the chains meet their diagnostics may differ, they share the
 * random draws but evaluate the potential at different positions.
 */
template <typename PotentialType, template <typename> class IntegratorType>
class CoupledHMCKernel {
public:
  CoupledHMCKernel(const PotentialType &potential, const HMCParameters &params)
      : kernel_(potential, params){};

  std::pair<CoupledState, CoupledHMCInfo>
  operator()(const RandomKey &key, const CoupledState &state) const {
    const TransitionKeys keys = split_transition_key(key);

    if (state.is_coupled) {
      auto [next_state, info] = kernel_.transition(keys, state.state_1);
      CoupledState next = {next_state, next_state, true};
      CoupledHMCInfo coupled_info = {info, info};
      return std::make_pair(std::move(next), std::move(coupled_info));
    }

    auto [next_state_1, info_1] = kernel_.transition(keys, state.state_1);
    auto [next_state_2, info_2] = kernel_.transition(keys, state.state_2);

    const bool has_met =
        bitwise_equal(next_state_1.position, next_state_2.position);

    CoupledState next = {std::move(next_state_1), std::move(next_state_2),
                         has_met};
    CoupledHMCInfo coupled_info = {std::move(info_1), std::move(info_2)};
    return std::make_pair(std::move(next), std::move(coupled_info));
  }

  CoupledState new_state(const Position &position_1,
                         const Position &position_2) const {
    return tandem::new_state(position_1, position_2, kernel_.potential());
  }

  const HMCKernel<PotentialType, IntegratorType> &single_chain_kernel() const {
    return kernel_;
  }

private:
  HMCKernel<PotentialType, IntegratorType> kernel_;
};

template <template <typename> class IntegratorType = VelocityVerlet,
          typename PotentialType>
inline CoupledHMCKernel<PotentialType, IntegratorType>
coupled_hmc_kernel(const PotentialType &potential,
                   const HMCParameters &params) {
  return CoupledHMCKernel<PotentialType, IntegratorType>(potential, params);
}

template <template <typename> class IntegratorType = VelocityVerlet,
          typename PotentialType>
inline CoupledHMCKernel<PotentialType, IntegratorType>
coupled_hmc_kernel(const PotentialType &potential, double step_size,
                   const Eigen::MatrixXd &inverse_mass_matrix,
                   std::size_t num_integration_steps,
                   double divergence_threshold = kDefaultDivergenceThreshold) {
  return coupled_hmc_kernel<IntegratorType>(
      potential, HMCParameters(step_size, inverse_mass_matrix,
                               num_integration_steps, divergence_threshold));
}

} // namespace tandem

#endif /* TANDEM_HMC_COUPLED_HMC_HPP_ */
