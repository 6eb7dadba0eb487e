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

#ifndef TANDEM_HMC_PROPOSAL_HPP_
#define TANDEM_HMC_PROPOSAL_HPP_

namespace tandem {

/*
 * `energy` is the total energy (potential + kinetic) of `state` and
 * `weight` is the log acceptance weight of the proposal relative to the
 * state the trajectory started from.
 */
struct Proposal {
  IntegratorState state;
  double energy;
  double weight;
};

struct SampledProposal {
  IntegratorState state;
  double acceptance_probability;
  bool is_accepted;
};

class ProposalGenerator {
public:
  ProposalGenerator(const GaussianEuclideanMetric &metric,
                    double divergence_threshold)
      : metric_(metric), divergence_threshold_(divergence_threshold){};

  double energy(const IntegratorState &state) const {
    return state.potential_energy + metric_.kinetic_energy(state.momentum);
  }

  Proposal init(const IntegratorState &state) const {
    return {state, energy(state), 0.};
  }

  /*
   * Builds the proposal for the end of a trajectory.  A trajectory is
   * divergent if the energy grew by more than the threshold (or is no
   * longer finite), in which case the proposal gets zero weight so it
   * can never be accepted.
   */
  std::pair<Proposal, bool> generate(double initial_energy,
                                     const IntegratorState &end_state) const {
    const double end_energy = energy(end_state);
    const double delta_energy = end_energy - initial_energy;
    const bool is_divergent =
        !std::isfinite(delta_energy) || delta_energy > divergence_threshold_;
    const double weight = is_divergent
                              ? -std::numeric_limits<double>::infinity()
                              : -delta_energy;
    return std::make_pair(Proposal{end_state, end_energy, weight},
                          is_divergent);
  }

private:
  GaussianEuclideanMetric metric_;
  double divergence_threshold_;
};

/*
 * min(1, exp(w_new - w_initial)) which for a regular proposal is just
 * the usual Metropolis ratio min(1, exp(H_initial - H_new)).
 */
inline double acceptance_probability(const Proposal &initial_proposal,
                                     const Proposal &new_proposal) {
  const double log_ratio = new_proposal.weight - initial_proposal.weight;
  if (std::isnan(log_ratio) || !std::isfinite(new_proposal.energy)) {
    return 0.;
  }
  return std::min(1., std::exp(log_ratio));
}

/*
 * Metropolis-Hastings step: keeps `new_proposal` with probability
 * min(1, exp(H_initial - H_new)), otherwise returns the initial state.
 */
inline SampledProposal static_binomial_sampling(const RandomKey &key,
                                                const Proposal &initial_proposal,
                                                const Proposal &new_proposal) {
  const double p_accept = acceptance_probability(initial_proposal, new_proposal);
  const bool do_accept = uniform(key) < p_accept;
  if (do_accept) {
    return {new_proposal.state, p_accept, true};
  }
  return {initial_proposal.state, p_accept, false};
}

} // namespace tandem

#endif /* TANDEM_HMC_PROPOSAL_HPP_ */
