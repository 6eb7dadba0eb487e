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

#ifndef TANDEM_CORE_DECLARATIONS_H
#define TANDEM_CORE_DECLARATIONS_H

namespace tandem {

/*
 * Core
 */
using ArrayKey = std::string;

struct ArrayTree;

// Positions, momenta and gradients all share the same tree structure.
using Position = ArrayTree;
using Momentum = ArrayTree;

template <typename ValueFunction, typename GradientFunction>
struct AnalyticPotential;

template <typename ValueFunction> struct FiniteDifferencePotential;

/*
 * Random
 */
struct RandomKey;

struct TransitionKeys;

using RandomEngine = std::mt19937_64;

/*
 * HMC
 */
class GaussianEuclideanMetric;

struct IntegratorState;

template <typename PotentialType> class VelocityVerlet;

template <typename PotentialType> class McLachlan;

template <typename StepFunction> class StaticIntegration;

struct Proposal;

struct SampledProposal;

class ProposalGenerator;

struct HMCParameters;

struct HMCInfo;

template <typename PotentialType,
          template <typename> class IntegratorType = VelocityVerlet>
class HMCKernel;

/*
 * Coupled HMC
 */
struct CoupledState;

struct CoupledHMCInfo;

template <typename PotentialType,
          template <typename> class IntegratorType = VelocityVerlet>
class CoupledHMCKernel;

/*
 * Samplers
 */
struct NullCallback;

} // namespace tandem

#endif
