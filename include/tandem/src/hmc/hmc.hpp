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

#ifndef TANDEM_HMC_HMC_HPP_
#define TANDEM_HMC_HMC_HPP_

namespace tandem {

constexpr double kDefaultDivergenceThreshold = 1000.;

/*
 * Everything needed to configure an HMC kernel apart from the potential.
 *
 * The inverse mass matrix is given either as a single column (the diagonal)
 * or as a full symmetric positive definite matrix, in both cases it's
 * defined against the flattened position.
 */
struct HMCParameters {

  HMCParameters()
      : step_size(0.), inverse_mass_matrix(), num_integration_steps(0),
        divergence_threshold(kDefaultDivergenceThreshold){};

  HMCParameters(double step_size_, const Eigen::MatrixXd &inverse_mass_matrix_,
                std::size_t num_integration_steps_,
                double divergence_threshold_ = kDefaultDivergenceThreshold)
      : step_size(step_size_), inverse_mass_matrix(inverse_mass_matrix_),
        num_integration_steps(num_integration_steps_),
        divergence_threshold(divergence_threshold_){};

  bool is_valid() const {
    return step_size > 0. && std::isfinite(step_size) &&
           num_integration_steps >= 1 && divergence_threshold > 0. &&
           inverse_mass_is_positive_definite();
  }

  bool operator==(const HMCParameters &other) const {
    return (step_size == other.step_size &&
            inverse_mass_matrix == other.inverse_mass_matrix &&
            num_integration_steps == other.num_integration_steps &&
            divergence_threshold == other.divergence_threshold);
  }

  double step_size;
  Eigen::MatrixXd inverse_mass_matrix;
  std::size_t num_integration_steps;
  double divergence_threshold;

private:
  bool inverse_mass_is_positive_definite() const {
    if (inverse_mass_matrix.size() == 0 || !inverse_mass_matrix.allFinite()) {
      return false;
    }
    if (inverse_mass_matrix.cols() == 1) {
      return (inverse_mass_matrix.array() > 0.).all();
    }
    if (inverse_mass_matrix.rows() != inverse_mass_matrix.cols() ||
        !inverse_mass_matrix.isApprox(inverse_mass_matrix.transpose())) {
      return false;
    }
    return inverse_mass_matrix.llt().info() == Eigen::Success;
  }
};

/*
 * Additional information on a single HMC transition, useful for
 * debugging and computing diagnostics.
 *
 *   momentum : the momentum sampled at the start of the trajectory
 *   acceptance_probability : min(1, exp(H_initial - H_proposal))
 *   is_accepted : whether the proposal or the original state was returned
 *   is_divergent : whether the energy error exceeded the threshold
 *   energy : total energy of the proposal
 *   proposal : the (momentum flipped) end point of the trajectory
 *   num_integration_steps : number of integrator steps in the trajectory
 */
struct HMCInfo {
  Momentum momentum;
  double acceptance_probability;
  bool is_accepted;
  bool is_divergent;
  double energy;
  IntegratorState proposal;
  std::size_t num_integration_steps;

  bool operator==(const HMCInfo &other) const {
    return (momentum == other.momentum &&
            acceptance_probability == other.acceptance_probability &&
            is_accepted == other.is_accepted &&
            is_divergent == other.is_divergent && energy == other.energy &&
            proposal == other.proposal &&
            num_integration_steps == other.num_integration_steps);
  }
};

/*
 * The vanilla HMC transition: sample a momentum, integrate a trajectory of
 * fixed length, flip the momentum at the end point and accept or reject
 * the end point with a Metropolis-Hastings step.
 *
 * A kernel is immutable and calling it is a pure function of the key and
 * the state, so the same key and state always give the same transition.
 */
template <typename PotentialType, template <typename> class IntegratorType>
class HMCKernel {
public:
  using Integrator = IntegratorType<PotentialType>;

  HMCKernel(const PotentialType &potential, const HMCParameters &params)
      : potential_(potential), params_(params),
        metric_(metric_from_inverse_mass_matrix(params.inverse_mass_matrix)),
        build_trajectory_(Integrator(potential, metric_), params.step_size,
                          params.num_integration_steps),
        proposal_generator_(metric_, params.divergence_threshold) {
    TANDEM_ASSERT(params_.is_valid() && "invalid HMC parameters");
  };

  std::pair<IntegratorState, HMCInfo>
  operator()(const RandomKey &key, const IntegratorState &state) const {
    return transition(split_transition_key(key), state);
  }

  /*
   * Performs the transition using pre-split keys, two chains given the
   * same keys share both their momentum and their acceptance draws.
   */
  std::pair<IntegratorState, HMCInfo>
  transition(const TransitionKeys &keys, const IntegratorState &state) const {
    IntegratorState initial_state(state);
    initial_state.momentum =
        metric_.sample_momentum(keys.momentum, state.position);

    const IntegratorState end_state =
        flip_momentum(build_trajectory_(initial_state));

    const Proposal proposal = proposal_generator_.init(initial_state);
    const auto [new_proposal, is_divergent] =
        proposal_generator_.generate(proposal.energy, end_state);

    SampledProposal sampled =
        static_binomial_sampling(keys.acceptance, proposal, new_proposal);

    HMCInfo info = {initial_state.momentum,
                    sampled.acceptance_probability,
                    sampled.is_accepted,
                    is_divergent,
                    new_proposal.energy,
                    new_proposal.state,
                    params_.num_integration_steps};

    return std::make_pair(std::move(sampled.state), std::move(info));
  }

  IntegratorState new_state(const Position &position) const {
    return tandem::new_state(position, potential_);
  }

  const HMCParameters &parameters() const { return params_; }

  const GaussianEuclideanMetric &metric() const { return metric_; }

  const PotentialType &potential() const { return potential_; }

private:
  PotentialType potential_;
  HMCParameters params_;
  GaussianEuclideanMetric metric_;
  StaticIntegration<Integrator> build_trajectory_;
  ProposalGenerator proposal_generator_;
};

template <template <typename> class IntegratorType = VelocityVerlet,
          typename PotentialType>
inline HMCKernel<PotentialType, IntegratorType>
hmc_kernel(const PotentialType &potential, const HMCParameters &params) {
  return HMCKernel<PotentialType, IntegratorType>(potential, params);
}

template <template <typename> class IntegratorType = VelocityVerlet,
          typename PotentialType>
inline HMCKernel<PotentialType, IntegratorType>
hmc_kernel(const PotentialType &potential, double step_size,
           const Eigen::MatrixXd &inverse_mass_matrix,
           std::size_t num_integration_steps,
           double divergence_threshold = kDefaultDivergenceThreshold) {
  return hmc_kernel<IntegratorType>(
      potential, HMCParameters(step_size, inverse_mass_matrix,
                               num_integration_steps, divergence_threshold));
}

} // namespace tandem

#endif /* TANDEM_HMC_HMC_HPP_ */
