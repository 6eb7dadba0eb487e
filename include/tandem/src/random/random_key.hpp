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

#ifndef TANDEM_RANDOM_RANDOM_KEY_HPP_
#define TANDEM_RANDOM_RANDOM_KEY_HPP_

namespace tandem {

/*
 * All the randomness used by the kernels comes from a RandomKey.  A key
 * is a plain value: there is no generator state hidden anywhere, new keys
 * are derived by splitting existing ones.  As a result handing the same
 * key to a kernel twice gives exactly the same transition, which is what
 * the coupled kernel relies on.
 */
struct RandomKey {

  RandomKey() : value(0){};

  explicit RandomKey(std::uint64_t value_) : value(value_){};

  bool operator==(const RandomKey &other) const {
    return value == other.value;
  }

  bool operator!=(const RandomKey &other) const { return !(*this == other); }

  std::uint64_t value;
};

namespace details {

constexpr std::uint64_t kGoldenGamma = 0x9e3779b97f4a7c15ULL;

/*
 * The SplitMix64 output function, a bijective mixer with good
 * avalanche behaviour.
 */
inline std::uint64_t mix64(std::uint64_t z) {
  z = (z ^ (z >> 30)) * 0xbf58476d1ce4e5b9ULL;
  z = (z ^ (z >> 27)) * 0x94d049bb133111ebULL;
  return z ^ (z >> 31);
}

} // namespace details

/*
 * Derives a new key from `key` and some integer data, different data
 * always gives unrelated keys.
 */
inline RandomKey fold_in(const RandomKey &key, std::uint64_t data) {
  const std::uint64_t mixed = details::mix64(key.value + details::kGoldenGamma);
  return RandomKey(
      details::mix64(mixed ^ details::mix64(data * details::kGoldenGamma +
                                            details::kGoldenGamma)));
}

inline std::vector<RandomKey> split(const RandomKey &key, std::size_t n) {
  std::vector<RandomKey> output;
  output.reserve(n);
  for (std::size_t i = 0; i < n; ++i) {
    output.push_back(fold_in(key, i));
  }
  return output;
}

/*
 * The two independent draws needed by a single HMC transition.
 */
struct TransitionKeys {
  RandomKey momentum;
  RandomKey acceptance;
};

inline TransitionKeys split_transition_key(const RandomKey &key) {
  const auto keys = split(key, 2);
  return {keys[0], keys[1]};
}

inline RandomEngine engine_from_key(const RandomKey &key) {
  return RandomEngine(details::mix64(key.value));
}

/*
 * A single uniform draw in [0, 1)
 */
inline double uniform(const RandomKey &key) {
  auto gen = engine_from_key(key);
  std::uniform_real_distribution<double> dist(0., 1.);
  return dist(gen);
}

inline std::ostream &operator<<(std::ostream &os, const RandomKey &key) {
  os << "RandomKey(" << key.value << ")";
  return os;
}

} // namespace tandem

#endif /* TANDEM_RANDOM_RANDOM_KEY_HPP_ */
