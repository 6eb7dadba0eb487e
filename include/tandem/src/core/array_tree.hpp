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

#ifndef TANDEM_CORE_ARRAY_TREE_HPP_
#define TANDEM_CORE_ARRAY_TREE_HPP_

namespace tandem {

/*
 * An ArrayTree is a collection of named numeric arrays.  It's used to
 * represent the position of a chain (ie, the variables of the target
 * distribution), the auxiliary momentum and the gradient of the potential.
 *
 * The arrays are kept in key order so that `flatten` gives a stable
 * layout, that layout is what the mass matrix is defined against.  For
 * example a tree holding {"mu": [a, b], "sigma": [c]} flattens to
 * [a, b, c].
 */
struct ArrayTree {

  ArrayTree(){};

  ArrayTree(std::initializer_list<std::pair<const ArrayKey, Eigen::VectorXd>>
                arrays_)
      : arrays(arrays_){};

  explicit ArrayTree(const std::map<ArrayKey, Eigen::VectorXd> &arrays_)
      : arrays(arrays_){};

  Eigen::VectorXd &operator[](const ArrayKey &key) { return arrays[key]; }

  const Eigen::VectorXd &at(const ArrayKey &key) const {
    return arrays.at(key);
  }

  bool contains(const ArrayKey &key) const {
    return arrays.find(key) != arrays.end();
  }

  std::size_t num_arrays() const { return arrays.size(); }

  bool empty() const { return arrays.empty(); }

  /*
   * The total number of scalar elements across all arrays.
   */
  Eigen::Index size() const {
    Eigen::Index n = 0;
    for (const auto &[key, array] : arrays) {
      n += array.size();
    }
    return n;
  }

  std::vector<ArrayKey> keys() const {
    std::vector<ArrayKey> output;
    output.reserve(arrays.size());
    for (const auto &[key, array] : arrays) {
      output.push_back(key);
    }
    return output;
  }

  Eigen::VectorXd flatten() const {
    Eigen::VectorXd output(size());
    Eigen::Index offset = 0;
    for (const auto &[key, array] : arrays) {
      output.segment(offset, array.size()) = array;
      offset += array.size();
    }
    return output;
  }

  /*
   * Builds a tree with the same structure as this one, but with
   * values taken (in flattened order) from `flat`.
   */
  ArrayTree unflatten(const Eigen::VectorXd &flat) const {
    TANDEM_ASSERT(flat.size() == size() &&
                  "flattened values don't match the tree structure");
    ArrayTree output;
    Eigen::Index offset = 0;
    for (const auto &[key, array] : arrays) {
      output.arrays[key] = flat.segment(offset, array.size());
      offset += array.size();
    }
    return output;
  }

  bool has_same_structure(const ArrayTree &other) const {
    if (arrays.size() != other.arrays.size()) {
      return false;
    }
    auto it = other.arrays.begin();
    for (const auto &[key, array] : arrays) {
      if (key != it->first || array.size() != it->second.size()) {
        return false;
      }
      ++it;
    }
    return true;
  }

  template <typename UnaryOp> ArrayTree map(UnaryOp &&op) const {
    ArrayTree output;
    for (const auto &[key, array] : arrays) {
      output.arrays[key] = op(array);
    }
    return output;
  }

  template <typename BinaryOp>
  ArrayTree zip_with(const ArrayTree &other, BinaryOp &&op) const {
    TANDEM_ASSERT(has_same_structure(other) &&
                  "element-wise operation on trees with different structure");
    ArrayTree output;
    auto it = other.arrays.begin();
    for (const auto &[key, array] : arrays) {
      output.arrays[key] = op(array, it->second);
      ++it;
    }
    return output;
  }

  ArrayTree operator+(const ArrayTree &other) const {
    return zip_with(other, [](const Eigen::VectorXd &x,
                              const Eigen::VectorXd &y) -> Eigen::VectorXd {
      return x + y;
    });
  }

  ArrayTree operator-(const ArrayTree &other) const {
    return zip_with(other, [](const Eigen::VectorXd &x,
                              const Eigen::VectorXd &y) -> Eigen::VectorXd {
      return x - y;
    });
  }

  ArrayTree operator-() const {
    return map([](const Eigen::VectorXd &x) -> Eigen::VectorXd { return -x; });
  }

  ArrayTree operator*(double scale) const {
    return map([scale](const Eigen::VectorXd &x) -> Eigen::VectorXd {
      return scale * x;
    });
  }

  ArrayTree &operator+=(const ArrayTree &other) {
    *this = *this + other;
    return *this;
  }

  ArrayTree &operator-=(const ArrayTree &other) {
    *this = *this - other;
    return *this;
  }

  /*
   * Value equality, NaN never compares equal and 0. == -0.
   */
  bool operator==(const ArrayTree &other) const {
    return has_same_structure(other) && flatten() == other.flatten();
  }

  bool operator!=(const ArrayTree &other) const { return !(*this == other); }

  std::map<ArrayKey, Eigen::VectorXd> arrays;
};

inline ArrayTree operator*(double scale, const ArrayTree &tree) {
  return tree * scale;
}

inline ArrayTree zeros_like(const ArrayTree &tree) {
  return tree.map([](const Eigen::VectorXd &x) -> Eigen::VectorXd {
    return Eigen::VectorXd::Zero(x.size());
  });
}

/*
 * Bit for bit comparison of two trees, this is the notion of equality
 * used to decide whether two coupled chains have met.
 */
inline bool bitwise_equal(const ArrayTree &x, const ArrayTree &y) {
  if (!x.has_same_structure(y)) {
    return false;
  }
  auto it = y.arrays.begin();
  for (const auto &[key, array] : x.arrays) {
    const auto n_bytes = cast::to_size(array.size()) * sizeof(double);
    if (n_bytes > 0 &&
        std::memcmp(array.data(), it->second.data(), n_bytes) != 0) {
      return false;
    }
    ++it;
  }
  return true;
}

inline bool all_finite(const ArrayTree &tree) {
  for (const auto &[key, array] : tree.arrays) {
    if (!array.allFinite()) {
      return false;
    }
  }
  return true;
}

/*
 * Convenience constructor for the common case of a tree holding a
 * single scalar, ie: scalar_tree("x", 1.)
 */
inline ArrayTree scalar_tree(const ArrayKey &key, double value) {
  ArrayTree output;
  output[key] = Eigen::VectorXd::Constant(1, value);
  return output;
}

inline std::ostream &operator<<(std::ostream &os, const ArrayTree &tree) {
  os << "{";
  bool first = true;
  for (const auto &[key, array] : tree.arrays) {
    if (!first) {
      os << ", ";
    }
    first = false;
    os << key << ": [" << array.transpose() << "]";
  }
  os << "}";
  return os;
}

} // namespace tandem

#endif /* TANDEM_CORE_ARRAY_TREE_HPP_ */
