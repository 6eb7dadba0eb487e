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

#include <gflags/gflags.h>
#include <fstream>
#include <iostream>

#include <tandem/Core>
#include <tandem/CoupledHMC>
#include <tandem/Samplers>
#include <tandem/Stats>

DEFINE_uint64(seed, 19, "seed of the random key driving the chains.");
DEFINE_int32(iterations, 5000, "number of coupled transitions.");
DEFINE_double(step_size, 0.01, "integrator step size.");
DEFINE_int32(num_integration_steps, 100, "integrator steps per transition.");
DEFINE_double(inverse_mass, 0.1, "diagonal of the inverse mass matrix.");
DEFINE_double(mean, 1., "mean of the gaussian target.");
DEFINE_double(sd, 2., "standard deviation of the gaussian target.");
DEFINE_double(start_1, 1., "initial position of the first chain.");
DEFINE_double(start_2, -1., "initial position of the second chain.");
DEFINE_string(output, "", "path where the coupled chains will be written in csv.");

namespace tandem {

/*
 * Calls each of a pair of callbacks in turn.
 */
template <typename First, typename Second> struct CallbackPair {
  template <typename StateType, typename InfoType>
  void operator()(std::size_t iteration, const StateType &state,
                  const InfoType &info) {
    first(iteration, state, info);
    second(iteration, state, info);
  }

  First first;
  Second second;
};

template <typename Callback>
void run_coupled_chains(const RandomKey &key, std::size_t iterations,
                        Callback &&callback) {
  const double mean = FLAGS_mean;
  const double sd = FLAGS_sd;
  auto value = [=](const ArrayTree &position) {
    double potential = 0.;
    const Eigen::VectorXd x = position.flatten();
    for (Eigen::Index i = 0; i < x.size(); ++i) {
      potential -= gaussian::log_pdf(x[i], mean, sd);
    }
    return potential;
  };
  auto gradient = [=](const ArrayTree &position) {
    return position.map([&](const Eigen::VectorXd &x) -> Eigen::VectorXd {
      return x.unaryExpr([&](double xi) {
        return gaussian::potential_gradient(xi, mean, sd);
      });
    });
  };
  const auto potential = potential_from_functions(value, gradient);

  const HMCParameters params(
      FLAGS_step_size, Eigen::MatrixXd::Constant(1, 1, FLAGS_inverse_mass),
      static_cast<std::size_t>(FLAGS_num_integration_steps));
  if (!params.is_valid()) {
    std::cerr << "Invalid sampler configuration, step_size and inverse_mass "
                 "must be positive."
              << std::endl;
    return;
  }

  const auto kernel = coupled_hmc_kernel(potential, params);
  const auto initial = kernel.new_state(scalar_tree("x", FLAGS_start_1),
                                        scalar_tree("x", FLAGS_start_2));

  const auto states = sample_chain(kernel, key, initial, iterations,
                                   std::forward<Callback>(callback));

  const auto meeting =
      std::find_if(states.begin(), states.end(),
                   [](const CoupledState &state) { return state.is_coupled; });
  if (meeting == states.end()) {
    std::cout << "Chains did not couple within " << iterations
              << " iterations, final positions " << states.back().state_1.position
              << " and " << states.back().state_2.position << std::endl;
  } else {
    std::cout << "Meeting time: " << (meeting - states.begin()) + 1
              << " iterations" << std::endl;
  }
}

} // namespace tandem

int main(int argc, char *argv[]) {
  gflags::ParseCommandLineFlags(&argc, &argv, true);

  using namespace tandem;

  if (FLAGS_iterations <= 0 || FLAGS_num_integration_steps <= 0 ||
      !(FLAGS_sd > 0.)) {
    std::cerr << "--iterations, --num_integration_steps and --sd must be "
                 "positive."
              << std::endl;
    return 1;
  }

  const RandomKey key(FLAGS_seed);
  const std::size_t iterations = static_cast<std::size_t>(FLAGS_iterations);

  std::shared_ptr<std::ostream> log_stream(&std::cout, [](std::ostream *) {});
  ProgressLoggingCallback progress(log_stream, 1000);

  if (FLAGS_output == "") {
    run_coupled_chains(key, iterations, progress);
  } else {
    std::cout << "Writing the coupled chains to " << FLAGS_output << std::endl;
    std::shared_ptr<std::ostream> ostream =
        std::make_shared<std::ofstream>(FLAGS_output);
    using Callbacks =
        CallbackPair<ProgressLoggingCallback &, CoupledCsvWritingCallback>;
    run_coupled_chains(key, iterations,
                       Callbacks{progress, CoupledCsvWritingCallback(ostream)});
  }

  std::cout << "Acceptance rate of the first chain: "
            << progress.acceptance_rate() << std::endl;
}
