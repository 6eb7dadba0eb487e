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

#ifndef TANDEM_CEREAL_HMC_HPP_
#define TANDEM_CEREAL_HMC_HPP_

/*
 * Serialization of chain states and transition records, together these
 * are enough to checkpoint a chain and resume it later: the state, the
 * kernel parameters and the key the driver was drawing from.
 */
namespace cereal {

template <class Archive>
inline void serialize(Archive &archive, tandem::ArrayTree &tree,
                      const std::uint32_t) {
  archive(cereal::make_nvp("arrays", tree.arrays));
}

template <class Archive>
inline void serialize(Archive &archive, tandem::RandomKey &key,
                      const std::uint32_t) {
  archive(cereal::make_nvp("value", key.value));
}

template <class Archive>
inline void serialize(Archive &archive, tandem::IntegratorState &state,
                      const std::uint32_t) {
  archive(cereal::make_nvp("position", state.position));
  archive(cereal::make_nvp("momentum", state.momentum));
  archive(cereal::make_nvp("potential_energy", state.potential_energy));
  archive(
      cereal::make_nvp("potential_energy_grad", state.potential_energy_grad));
}

template <class Archive>
inline void serialize(Archive &archive, tandem::HMCParameters &params,
                      const std::uint32_t) {
  archive(cereal::make_nvp("step_size", params.step_size));
  archive(cereal::make_nvp("inverse_mass_matrix", params.inverse_mass_matrix));
  archive(
      cereal::make_nvp("num_integration_steps", params.num_integration_steps));
  archive(cereal::make_nvp("divergence_threshold", params.divergence_threshold));
}

template <class Archive>
inline void serialize(Archive &archive, tandem::HMCInfo &info,
                      const std::uint32_t) {
  archive(cereal::make_nvp("momentum", info.momentum));
  archive(
      cereal::make_nvp("acceptance_probability", info.acceptance_probability));
  archive(cereal::make_nvp("is_accepted", info.is_accepted));
  archive(cereal::make_nvp("is_divergent", info.is_divergent));
  archive(cereal::make_nvp("energy", info.energy));
  archive(cereal::make_nvp("proposal", info.proposal));
  archive(
      cereal::make_nvp("num_integration_steps", info.num_integration_steps));
}

template <class Archive>
inline void serialize(Archive &archive, tandem::CoupledState &state,
                      const std::uint32_t) {
  archive(cereal::make_nvp("state_1", state.state_1));
  archive(cereal::make_nvp("state_2", state.state_2));
  archive(cereal::make_nvp("is_coupled", state.is_coupled));
}

template <class Archive>
inline void serialize(Archive &archive, tandem::CoupledHMCInfo &info,
                      const std::uint32_t) {
  archive(cereal::make_nvp("info_1", info.info_1));
  archive(cereal::make_nvp("info_2", info.info_2));
}

} // namespace cereal

#endif /* TANDEM_CEREAL_HMC_HPP_ */
