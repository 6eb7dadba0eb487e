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

#ifndef TANDEM_CSV_UTILS_H
#define TANDEM_CSV_UTILS_H

/*
 * Helpers for writing chains to CSV so they can be inspected with
 * external tools.  Each row is built as a map from column name to
 * (already formatted) value, columns missing from a row are left empty.
 */

namespace tandem {

inline std::string to_csv_string(double x) {
  std::ostringstream oss;
  oss << std::setprecision(std::numeric_limits<double>::max_digits10) << x;
  return oss.str();
}

inline std::string to_csv_string(bool x) { return x ? "1" : "0"; }

inline std::string to_csv_string(std::size_t x) { return std::to_string(x); }

/*
 * Column names for the flattened elements of a tree, an array "x" with
 * two elements gives "x.0" and "x.1".
 */
inline std::vector<std::string> flattened_names(const ArrayTree &tree,
                                                const std::string &prefix = "") {
  std::vector<std::string> names;
  for (const auto &[key, array] : tree.arrays) {
    for (Eigen::Index i = 0; i < array.size(); ++i) {
      names.push_back(prefix + key + "." + std::to_string(i));
    }
  }
  return names;
}

inline std::map<std::string, std::string> to_map(const ArrayTree &tree,
                                                 const std::string &prefix = "") {
  std::map<std::string, std::string> output;
  for (const auto &[key, array] : tree.arrays) {
    for (Eigen::Index i = 0; i < array.size(); ++i) {
      output[prefix + key + "." + std::to_string(i)] = to_csv_string(array[i]);
    }
  }
  return output;
}

template <typename K, typename V>
inline bool map_contains(const std::map<K, V> &m, const K &k) {
  return m.find(k) != m.end();
}

template <typename K, typename V>
inline std::map<K, V> map_join(const std::map<K, V> &m,
                               const std::map<K, V> &other) {
  std::map<K, V> join(other);
  // values in `m` take precedence
  for (const auto &pair : m) {
    join[pair.first] = pair.second;
  }
  return join;
}

inline void write_row(std::ostream &stream,
                      const std::map<std::string, std::string> &row,
                      const std::vector<std::string> &columns) {
  for (std::size_t i = 0; i < columns.size(); ++i) {
    if (map_contains(row, columns[i])) {
      stream << row.at(columns[i]);
    }
    if (i + 1 < columns.size()) {
      stream << ",";
    }
  }
  stream << std::endl;
}

inline void write_header(std::ostream &stream,
                         const std::vector<std::string> &columns) {
  for (std::size_t i = 0; i < columns.size(); ++i) {
    stream << columns[i];
    if (i + 1 < columns.size()) {
      stream << ",";
    }
  }
  stream << std::endl;
}

} // namespace tandem

#endif
