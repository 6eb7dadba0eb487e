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

#ifndef TANDEM_SAMPLERS_CALLBACKS_HPP_
#define TANDEM_SAMPLERS_CALLBACKS_HPP_

namespace tandem {

struct NullCallback {
  template <typename StateType, typename InfoType>
  void operator()(std::size_t, const StateType &, const InfoType &){};
};

/*
 * Periodically reports the acceptance rate and number of divergences.
 * For coupled chains the statistics are those of the first chain and
 * the iteration at which the chains met is reported once.
 */
struct ProgressLoggingCallback {

  ProgressLoggingCallback(std::shared_ptr<std::ostream> &stream_,
                          std::size_t every_ = 1000)
      : stream(stream_), every(every_){};

  ProgressLoggingCallback(std::shared_ptr<std::ostream> &&stream_,
                          std::size_t every_ = 1000)
      : stream(std::move(stream_)), every(every_){};

  void operator()(std::size_t iteration, const IntegratorState &,
                  const HMCInfo &info) {
    update(info);
    maybe_report(iteration);
  }

  void operator()(std::size_t iteration, const CoupledState &state,
                  const CoupledHMCInfo &info) {
    update(info.info_1);
    if (state.is_coupled && meeting_iteration == 0) {
      meeting_iteration = iteration;
      (*stream) << "Chains coupled at iteration " << iteration << std::endl;
    }
    maybe_report(iteration);
  }

  double acceptance_rate() const {
    return count > 0 ? cast::to_double(accepted) / cast::to_double(count) : 0.;
  }

  std::size_t count = 0;
  std::size_t accepted = 0;
  std::size_t divergences = 0;
  std::size_t meeting_iteration = 0;
  std::shared_ptr<std::ostream> stream;
  std::size_t every;

private:
  void update(const HMCInfo &info) {
    ++count;
    if (info.is_accepted) {
      ++accepted;
    }
    if (info.is_divergent) {
      ++divergences;
    }
  }

  void maybe_report(std::size_t iteration) {
    if (every > 0 && iteration % every == 0) {
      (*stream) << "Iteration: " << iteration
                << " acceptance_rate: " << acceptance_rate()
                << " divergences: " << divergences << std::endl;
    }
  }
};

/*
 * Writes a line for every divergent transition, which is usually the
 * first thing to look at when a chain misbehaves.
 */
struct DivergenceLoggingCallback {

  DivergenceLoggingCallback(std::shared_ptr<std::ostream> &stream_)
      : stream(stream_){};

  DivergenceLoggingCallback(std::shared_ptr<std::ostream> &&stream_)
      : stream(std::move(stream_)){};

  void operator()(std::size_t iteration, const IntegratorState &state,
                  const HMCInfo &info) {
    if (info.is_divergent) {
      log(iteration, "", state, info);
    }
  }

  void operator()(std::size_t iteration, const CoupledState &state,
                  const CoupledHMCInfo &info) {
    if (info.info_1.is_divergent) {
      log(iteration, " (chain 1)", state.state_1, info.info_1);
    }
    if (!state.is_coupled && info.info_2.is_divergent) {
      log(iteration, " (chain 2)", state.state_2, info.info_2);
    }
  }

  std::shared_ptr<std::ostream> stream;

private:
  void log(std::size_t iteration, const std::string &label,
           const IntegratorState &state, const HMCInfo &info) {
    (*stream) << "Divergent transition at iteration " << iteration << label
              << ": proposal energy " << info.energy << " from position "
              << state.position << std::endl;
  }
};

inline std::vector<std::string>
get_sampler_csv_columns(const ArrayTree &example) {
  std::vector<std::string> columns = {"iteration", "potential_energy",
                                      "acceptance_probability", "is_accepted",
                                      "is_divergent"};
  const auto names = flattened_names(example);
  columns.insert(columns.end(), names.begin(), names.end());
  return columns;
}

inline std::map<std::string, std::string> to_map(std::size_t iteration,
                                                 const IntegratorState &state,
                                                 const HMCInfo &info) {
  auto row = to_map(state.position);
  row["iteration"] = to_csv_string(iteration);
  row["potential_energy"] = to_csv_string(state.potential_energy);
  row["acceptance_probability"] = to_csv_string(info.acceptance_probability);
  row["is_accepted"] = to_csv_string(info.is_accepted);
  row["is_divergent"] = to_csv_string(info.is_divergent);
  return row;
}

/*
 * Writes one row per iteration, the header is written on the first call.
 */
struct CsvWritingCallback {

  CsvWritingCallback(std::shared_ptr<std::ostream> &stream_)
      : stream(stream_){};

  CsvWritingCallback(std::shared_ptr<std::ostream> &&stream_)
      : stream(std::move(stream_)){};

  void operator()(std::size_t iteration, const IntegratorState &state,
                  const HMCInfo &info) {
    if (columns.empty()) {
      columns = get_sampler_csv_columns(state.position);
      write_header(*stream, columns);
    }
    write_row(*stream, to_map(iteration, state, info), columns);
  }

  std::shared_ptr<std::ostream> stream;
  std::vector<std::string> columns;
};

/*
 * Like CsvWritingCallback but with the columns of both chains (prefixed
 * with "chain_1." and "chain_2.") and an `is_coupled` column.
 */
struct CoupledCsvWritingCallback {

  CoupledCsvWritingCallback(std::shared_ptr<std::ostream> &stream_)
      : stream(stream_){};

  CoupledCsvWritingCallback(std::shared_ptr<std::ostream> &&stream_)
      : stream(std::move(stream_)){};

  void operator()(std::size_t iteration, const CoupledState &state,
                  const CoupledHMCInfo &info) {
    if (columns.empty()) {
      columns = {"iteration", "is_coupled"};
      for (const std::string prefix : {"chain_1.", "chain_2."}) {
        for (const auto &column : get_sampler_csv_columns(state.state_1.position)) {
          if (column != "iteration") {
            columns.push_back(prefix + column);
          }
        }
      }
      write_header(*stream, columns);
    }

    std::map<std::string, std::string> row;
    row["iteration"] = to_csv_string(iteration);
    row["is_coupled"] = to_csv_string(state.is_coupled);
    row = map_join(row, prefixed(to_map(iteration, state.state_1, info.info_1),
                                 "chain_1."));
    row = map_join(row, prefixed(to_map(iteration, state.state_2, info.info_2),
                                 "chain_2."));
    write_row(*stream, row, columns);
  }

  std::shared_ptr<std::ostream> stream;
  std::vector<std::string> columns;

private:
  static std::map<std::string, std::string>
  prefixed(const std::map<std::string, std::string> &row,
           const std::string &prefix) {
    std::map<std::string, std::string> output;
    for (const auto &pair : row) {
      output[prefix + pair.first] = pair.second;
    }
    return output;
  }
};

} // namespace tandem

#endif /* TANDEM_SAMPLERS_CALLBACKS_HPP_ */
